//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Component parsing.  Grammar, with the parts each extension enables:
//
//   component  ::= sigil modifiers? name body? suffix?
//   sigil      ::= '@' | '#' | '~'
//   modifiers  ::= ('@' | '&' | '?' | '-' | '+' | '&(' '='? '~'? INT ')')+
//   name       ::= words-up-to-'{' | single-word
//   body       ::= '{' quantity? '}'
//   suffix     ::= '*'? ('(' note ')')?
//
// A sigil that does not start a valid component is ordinary text.  Warnings
// about modifiers and names are collected in a pending report and only kept
// once the component is accepted.
//
//===----------------------------------------------------------------------===//

#include "parse/Parser.hpp"

#include <charconv>

namespace sous::parse
{

using support::DiagCode;
using support::SourceReport;
using support::Span;

namespace
{

const char *componentName(TokenKind sigil)
{
    switch (sigil)
    {
        case TokenKind::At:
            return "ingredient";
        case TokenKind::Hash:
            return "cookware";
        default:
            return "timer";
    }
}

/// @brief Set @p flag, warning when it was already set.
void setModifier(bool &flag, const Token &tok, SourceReport &pending)
{
    if (flag)
    {
        pending.warning(DiagCode::P008_DuplicateModifier,
                        tok.span,
                        "duplicate modifier '" + std::string(tok.text) + "'");
        return;
    }
    flag = true;
}

/// @brief Symbols that make a single-word name suspicious when glued to it.
bool isGluedSymbol(const Token &tok, bool aliasEnabled)
{
    switch (tok.kind)
    {
        case TokenKind::And:
        case TokenKind::Eq:
        case TokenKind::Plus:
        case TokenKind::Star:
        case TokenKind::Percent:
        case TokenKind::Slash:
        case TokenKind::Minus:
        case TokenKind::At:
        case TokenKind::Hash:
        case TokenKind::Tilde:
        case TokenKind::Escaped:
            return true;
        case TokenKind::Or:
            return !aliasEnabled;
        default:
            return false;
    }
}

} // namespace

//===----------------------------------------------------------------------===//
// Modifiers
//===----------------------------------------------------------------------===//

size_t Parser::parseModifiers(size_t pos,
                              size_t end,
                              TokenKind sigil,
                              Component &comp,
                              SourceReport &pending)
{
    Modifiers &mods = comp.modifiers;
    size_t i = pos;
    while (i < end)
    {
        const Token &tok = tokens_[i];
        switch (tok.kind)
        {
            case TokenKind::At:
                if (sigil == TokenKind::Hash)
                {
                    pending.warning(DiagCode::P007_ComponentPartIgnored,
                                    tok.span,
                                    "cookware cannot be a recipe reference");
                }
                else
                {
                    setModifier(mods.recipe, tok, pending);
                }
                ++i;
                continue;

            case TokenKind::And:
                if (i + 1 < end && tokens_[i + 1].is(TokenKind::OpenParen) &&
                    hasExtension(extensions_, Extensions::IntermediatePreparations))
                {
                    const size_t next = parseIntermediate(i + 1, end, comp, pending);
                    if (next == i + 1)
                        return i;
                    if (sigil == TokenKind::Hash)
                    {
                        pending.warning(DiagCode::P007_ComponentPartIgnored,
                                        Span::merge(tok.span, tokens_[next - 1].span),
                                        "cookware cannot reference an intermediate preparation");
                        comp.intermediate.reset();
                    }
                    else
                    {
                        setModifier(mods.reference, tok, pending);
                    }
                    i = next;
                    continue;
                }
                setModifier(mods.reference, tok, pending);
                ++i;
                continue;

            case TokenKind::Question:
                setModifier(mods.optional, tok, pending);
                ++i;
                continue;

            case TokenKind::Minus:
                setModifier(mods.hidden, tok, pending);
                ++i;
                continue;

            case TokenKind::Plus:
                setModifier(mods.isNew, tok, pending);
                ++i;
                continue;

            default:
                break;
        }
        break;
    }

    if (mods.reference && mods.isNew)
    {
        pending.warning(DiagCode::P009_ConflictingModifiers,
                        Span::merge(tokens_[pos].span, tokens_[i - 1].span),
                        "'&' and '+' cannot be combined")
            .withHelp("'+' is ignored");
        mods.isNew = false;
    }
    return i;
}

size_t Parser::parseIntermediate(size_t pos, size_t end, Component &comp, SourceReport &pending)
{
    IntermediateRef ref;
    size_t i = pos + 1;
    if (i < end && tokens_[i].is(TokenKind::Eq))
    {
        ref.kind = IntermediateKind::Section;
        ++i;
    }
    if (i < end && tokens_[i].is(TokenKind::Tilde))
    {
        ref.relative = true;
        ++i;
    }

    bool ok = i + 1 < end && tokens_[i].is(TokenKind::Int) && tokens_[i + 1].is(TokenKind::CloseParen);
    if (ok)
    {
        const auto text = tokens_[i].text;
        const auto r = std::from_chars(text.data(), text.data() + text.size(), ref.value);
        ok = r.ec == std::errc{};
    }
    if (!ok)
    {
        report_.warning(DiagCode::P014_InvalidIntermediateReference,
                        tokens_[pos].span,
                        "invalid intermediate preparation reference")
            .withHelp("use '&(N)', '&(~N)', '&(=N)' or '&(=~N)'");
        return pos;
    }

    ref.span = Span::merge(tokens_[pos - 1].span, tokens_[i + 1].span);
    if (comp.intermediate)
    {
        pending.warning(DiagCode::P008_DuplicateModifier, ref.span, "duplicate intermediate reference");
        return i + 2;
    }
    comp.intermediate = ref;
    return i + 2;
}

//===----------------------------------------------------------------------===//
// Names
//===----------------------------------------------------------------------===//

size_t Parser::findNameBrace(size_t pos, size_t end) const
{
    for (size_t i = pos; i < end; ++i)
    {
        switch (tokens_[i].kind)
        {
            case TokenKind::OpenBrace:
                return i;
            case TokenKind::Newline:
            case TokenKind::At:
            case TokenKind::Hash:
            case TokenKind::Tilde:
            case TokenKind::CloseBrace:
                return end;
            default:
                break;
        }
    }
    return end;
}

size_t Parser::scanSingleWordName(size_t pos, size_t end, SourceReport &pending)
{
    const bool aliasEnabled = hasExtension(extensions_, Extensions::ComponentAlias);
    size_t i = pos;
    while (i < end)
    {
        const Token &tok = tokens_[i];
        if (tok.isOneOf(TokenKind::Word, TokenKind::Int))
        {
            ++i;
            continue;
        }
        if (aliasEnabled && tok.is(TokenKind::Or) && i > pos && i + 1 < end &&
            tokens_[i + 1].isOneOf(TokenKind::Word, TokenKind::Int))
        {
            ++i;
            continue;
        }
        break;
    }
    if (i == pos || i >= end)
        return i;

    const Token &next = tokens_[i];
    const bool decimal = next.is(TokenKind::Float) ||
                         (next.is(TokenKind::Punctuation) && next.text == "." && i + 1 < end &&
                          tokens_[i + 1].is(TokenKind::Int));
    if (decimal)
    {
        const Span numSpan = next.is(TokenKind::Float) ? next.span : Span::merge(next.span, tokens_[i + 1].span);
        pending.warning(DiagCode::P002_AmbiguousDecimalName,
                        Span::merge(tokens_[pos].span, numSpan),
                        "name is followed by a decimal number")
            .withHelp("use braces to delimit the name, as in '@name{}'");
    }
    else if (isGluedSymbol(next, aliasEnabled))
    {
        pending.warning(DiagCode::P003_BadName,
                        next.span,
                        "symbol '" + std::string(next.text) + "' is attached to the name")
            .label(Span::merge(tokens_[pos].span, tokens_[i - 1].span), "name ends here")
            .withHelp("use braces for names with symbols, as in '@name{}'");
    }
    return i;
}

void Parser::splitAlias(std::span<const Token> nameTokens,
                        TokenKind sigil,
                        Component &comp,
                        SourceReport &pending)
{
    size_t bar = nameTokens.size();
    if (hasExtension(extensions_, Extensions::ComponentAlias))
    {
        for (size_t k = 0; k < nameTokens.size(); ++k)
        {
            if (nameTokens[k].is(TokenKind::Or))
            {
                bar = k;
                break;
            }
        }
    }

    const auto name = trimTrivia(nameTokens.subspan(0, bar));
    comp.name = joinTokens(name);
    comp.nameSpan = spanOf(name, nameTokens.empty() ? comp.span : nameTokens.front().span);
    if (bar == nameTokens.size())
        return;

    const Token &barTok = nameTokens[bar];
    const auto alias = trimTrivia(nameTokens.subspan(bar + 1));
    if (sigil == TokenKind::Tilde)
    {
        pending.warning(DiagCode::P007_ComponentPartIgnored,
                        spanOf(nameTokens.subspan(bar), barTok.span),
                        "timers cannot have an alias");
        return;
    }
    if (alias.empty())
    {
        pending.warning(DiagCode::P007_ComponentPartIgnored, barTok.span, "alias is empty");
        return;
    }
    comp.alias = joinTokens(alias);
}

//===----------------------------------------------------------------------===//
// Components
//===----------------------------------------------------------------------===//

size_t Parser::degrade(size_t begin, size_t end, DiagCode code, std::string message)
{
    report_.warning(code, Span::merge(tokens_[begin].span, tokens_[end - 1].span), std::move(message));
    for (size_t i = begin; i < end; ++i)
        appendText(tokens_[i]);
    return end;
}

size_t Parser::parseComponent(size_t pos, size_t end)
{
    const Token &sigilTok = tokens_[pos];
    const TokenKind sigil = sigilTok.kind;
    const std::string kindName = componentName(sigil);

    Component comp;
    comp.span = sigilTok.span;
    SourceReport pending;

    size_t i = pos + 1;
    if (hasExtension(extensions_, Extensions::ComponentModifiers))
        i = parseModifiers(i, end, sigil, comp, pending);

    if (sigil == TokenKind::Tilde && (comp.modifiers.any() || comp.intermediate))
    {
        pending.warning(DiagCode::P007_ComponentPartIgnored,
                        Span::merge(tokens_[pos + 1].span, tokens_[i - 1].span),
                        "timers cannot have modifiers");
        comp.modifiers = Modifiers{};
        comp.intermediate.reset();
    }
    const size_t brace = i < end ? findNameBrace(i, end) : end;
    if (brace == end)
    {
        // Single word, no body.
        const size_t nameEnd = scanSingleWordName(i, end, pending);
        if (nameEnd == i || sigil == TokenKind::Tilde)
            return pos;
        comp.span = Span::merge(sigilTok.span, tokens_[nameEnd - 1].span);
        splitAlias(tokensOf(i, nameEnd), sigil, comp, pending);
        report_.append(pending);
        flushText();
        if (sigil == TokenKind::At)
            events_.emplace_back(IngredientEvent{std::move(comp)});
        else
            events_.emplace_back(CookwareEvent{std::move(comp)});
        return nameEnd;
    }

    if (brace > i && tokens_[i].is(TokenKind::Whitespace))
        return pos;

    size_t close = brace + 1;
    while (close < end && !tokens_[close].isOneOf(TokenKind::CloseBrace, TokenKind::Newline))
        ++close;
    if (close >= end || !tokens_[close].is(TokenKind::CloseBrace))
    {
        return degrade(pos,
                       brace + 1,
                       DiagCode::P001_UnterminatedComponent,
                       std::string("unterminated ") + kindName + ": '{' is never closed");
    }

    const auto body = tokensOf(brace + 1, close);
    const bool emptyBody = trimTrivia(body).empty();
    const auto nameTokens = tokensOf(i, brace);
    if (trimTrivia(nameTokens).empty() && (sigil != TokenKind::Tilde || emptyBody))
    {
        return degrade(pos,
                       close + 1,
                       DiagCode::P010_EmptyComponent,
                       sigil == TokenKind::Tilde ? std::string("timer has neither name nor duration")
                                                 : kindName + " has no name");
    }

    comp.span = Span::merge(sigilTok.span, tokens_[close].span);
    splitAlias(nameTokens, sigil, comp, pending);
    report_.append(pending);

    if (!emptyBody)
    {
        const Span bodySpan{fileId_, tokens_[brace].span.end, tokens_[close].span.begin};
        ParsedQuantity q = quantities_.parseQuantity(body, bodySpan);
        if (sigil == TokenKind::Hash && q.unit)
        {
            report_.warning(DiagCode::P007_ComponentPartIgnored,
                            q.unitSpan.value_or(q.span),
                            "cookware quantity cannot have a unit")
                .withHelp("the unit is ignored");
            q.unit.reset();
            q.unitSpan.reset();
        }
        comp.quantity = std::move(q);
    }

    const size_t next = parseSuffix(close + 1, end, sigil, comp);
    comp.span = Span::merge(comp.span, tokens_[next - 1].span);

    flushText();
    switch (sigil)
    {
        case TokenKind::At:
            events_.emplace_back(IngredientEvent{std::move(comp)});
            break;
        case TokenKind::Hash:
            events_.emplace_back(CookwareEvent{std::move(comp)});
            break;
        default:
            events_.emplace_back(TimerEvent{std::move(comp)});
            break;
    }
    return next;
}

size_t Parser::parseSuffix(size_t pos, size_t end, TokenKind sigil, Component &comp)
{
    size_t i = pos;
    if (i < end && tokens_[i].is(TokenKind::Star))
    {
        if (sigil != TokenKind::At)
        {
            report_.warning(DiagCode::P007_ComponentPartIgnored,
                            tokens_[i].span,
                            std::string("a ") + componentName(sigil) + " cannot be marked fixed");
        }
        else if (!comp.quantity)
        {
            report_.warning(DiagCode::P007_ComponentPartIgnored,
                            tokens_[i].span,
                            "'*' has no quantity to fix");
        }
        else
        {
            comp.quantity->fixed = true;
        }
        ++i;
    }

    if (sigil == TokenKind::Tilde || !hasExtension(extensions_, Extensions::ComponentNote))
        return i;
    if (i >= end || !tokens_[i].is(TokenKind::OpenParen))
        return i;

    size_t close = i + 1;
    while (close < end && !tokens_[close].isOneOf(TokenKind::CloseParen, TokenKind::Newline))
        ++close;
    if (close >= end || !tokens_[close].is(TokenKind::CloseParen))
        return i;

    comp.note = joinTokens(trimTrivia(tokensOf(i + 1, close)));
    return close + 1;
}

} // namespace sous::parse
