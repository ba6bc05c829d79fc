#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <seqmatch/QuantifiedItem.hpp>
#include <seqmatch/Slice.hpp>
#include <seqmatch/Types.hpp>

namespace seqmatch::notation {

class Diagnostics;
class Scanner;
class Token;

using Item = QuantifiedItem<std::string>;

// A quantifier bound; empty when the notation leaves it out
using Bound = std::optional<MatchCount>;

/**
 * Recursive descent over the sequence notation
 *
 *   sequence   := '[' items ']' | items
 *   items      := (item separator?)*
 *   separator  := ';' | ','
 *   item       := identifier quantifier?
 *   quantifier := '*' | '+' | '?' | '{' bounds '}'
 *   bounds     := integer | integer? ':' integer?
 *
 * Errors are filed with the Diagnostics and parsing resumes at the next
 * item, so one pass reports every malformed item it can find.
 */
class SequenceParser
{
public:
    SequenceParser(Diagnostics& dgn, Scanner& scanner);

    SequenceParser(SequenceParser const&) = delete;
    void operator = (SequenceParser const&) = delete;

public:
    std::vector<Item> parseSequence();
    std::optional<Item> parseItem();

protected:
    std::optional<Quantifier> parseQuantifier();
    std::optional<Quantifier> parseBounds(Token const& open);
    std::optional<Bound> parseBound();

    void skipItem();
    void skipBounds();

    Diagnostics& diagnostics();
    Scanner& scanner();

private:
    Diagnostics* myDiagnostics = nullptr;
    Scanner* myScanner = nullptr;
};

std::vector<Item> parseSequence(std::string_view text, Diagnostics& dgn);
std::optional<Item> parseItem(std::string_view text, Diagnostics& dgn);

// Renders items the way parseSequence reads them back: "[A;B*;C{2:5}]"
std::string render(Slice<Item const> items);

} // namespace seqmatch::notation
