#pragma once

#include <optional>
#include <string>
#include <vector>

#include <seqmatch/Stream.hpp>
#include <seqmatch/Types.hpp>

namespace seqmatch {

using MatchCount = u32;

/**
 * Repetition bounds of a sequence item
 *
 * An item must correspond to at least minMatches and at most maxMatches
 * elements of the opposing sequence. An absent maxMatches is unbounded.
 * The bounds are checked on construction; min > max throws.
 */
class Quantifier
{
public:
    static Quantifier one();
    static Quantifier optional();
    static Quantifier zeroOrMore();
    static Quantifier oneOrMore();
    static Quantifier atLeast(MatchCount min);
    static Quantifier exactly(MatchCount n);
    static Quantifier upTo(MatchCount max);
    static Quantifier between(MatchCount min, MatchCount max);

public:
    Quantifier(MatchCount min, std::optional<MatchCount> max);

public:
    MatchCount minMatches() const noexcept { return myMin; }
    std::optional<MatchCount> maxMatches() const noexcept { return myMax; }

    bool bounded() const noexcept { return myMax.has_value(); }

    // More than one occurrence, or an optional single occurrence
    bool isRepeated() const noexcept;

    bool operator == (Quantifier const& rhs) const noexcept;
    bool operator != (Quantifier const& rhs) const noexcept;

private:
    MatchCount myMin = 1;
    std::optional<MatchCount> myMax = 1;
};

template <typename T>
class QuantifiedItem
{
public:
    using Item = T;

public:
    /*implicit*/ QuantifiedItem(T item)
        : myItem(std::move(item))
        , myQuantifier(Quantifier::one())
    {
    }

    QuantifiedItem(T item, Quantifier quantifier)
        : myItem(std::move(item))
        , myQuantifier(quantifier)
    {
    }

    QuantifiedItem(T item, MatchCount min, std::optional<MatchCount> max)
        : QuantifiedItem(std::move(item), Quantifier(min, max))
    {
    }

public:
    T const& item() const noexcept { return myItem; }
    Quantifier const& quantifier() const noexcept { return myQuantifier; }

    MatchCount minMatches() const noexcept { return myQuantifier.minMatches(); }
    std::optional<MatchCount> maxMatches() const noexcept { return myQuantifier.maxMatches(); }

    bool isRepeated() const noexcept { return myQuantifier.isRepeated(); }

public:
    bool operator == (QuantifiedItem const& rhs) const
    {
        return myQuantifier == rhs.myQuantifier && myItem == rhs.myItem;
    }

    bool operator != (QuantifiedItem const& rhs) const
    {
        return !operator==(rhs);
    }

private:
    T myItem;
    Quantifier myQuantifier;
};

/**
 * Progress of one walk over a quantified item
 *
 * Trackers are values: matched() produces the successor and leaves the
 * receiver untouched, so sibling branches of the search never observe
 * each other's counts. A tracker refers to the caller's item and must not
 * outlive it.
 */
template <typename T>
class MatchTracker
{
public:
    explicit MatchTracker(QuantifiedItem<T> const& item, MatchCount matches = 0) noexcept
        : myItem(&item)
        , myMatches(matches)
    {
    }

public:
    QuantifiedItem<T> const& sequenceItem() const noexcept { return *myItem; }
    T const& item() const noexcept { return myItem->item(); }
    MatchCount matches() const noexcept { return myMatches; }

    bool hasMoreMatches() const noexcept
    {
        auto const max = myItem->maxMatches();
        return !max || myMatches < *max;
    }

    bool isSkippable() const noexcept
    {
        return myItem->minMatches() == 0;
    }

    MatchTracker matched() const noexcept
    {
        return MatchTracker(*myItem, myMatches + 1);
    }

private:
    QuantifiedItem<T> const* myItem = nullptr;
    MatchCount myMatches = 0;
};

template <typename T>
std::vector<MatchTracker<T>> trackers(std::vector<QuantifiedItem<T>> const& sequence)
{
    std::vector<MatchTracker<T>> ret;
    ret.reserve(sequence.size());
    for ( auto const& e : sequence )
        ret.emplace_back(e);

    return ret;
}

namespace ascii {
    // Writes the quantifier suffix: "", "*", "+", "?" or "{min:max}"
    template <typename Sink>
    void write(Sink& sink, Quantifier const& q)
    {
        auto const min = q.minMatches();
        auto const max = q.maxMatches();
        if ( min == 1 && max == 1u )
            return;

        if ( min == 0 && !max ) {
            sink.write('*');
            return;
        }

        if ( min == 1 && !max ) {
            sink.write('+');
            return;
        }

        if ( min == 0 && max == 1u ) {
            sink.write('?');
            return;
        }

        sink.write('{');
        write(sink, min);
        sink.write(':');
        if ( max )
            write(sink, *max);
        sink.write('}');
    }
} // namespace ascii

std::string str(Quantifier const& q);

template <typename T>
std::string str(QuantifiedItem<T> const* item, Show<T> const& show)
{
    if ( !item )
        return "undefined";

    StringSink sink;
    ascii::write(sink, show(item->item()));
    ascii::write(sink, item->quantifier());
    return std::move(sink).str();
}

// Appends ".[count]" for items that can match more than once
template <typename T>
std::string str(MatchTracker<T> const* tracker, Show<T> const& show)
{
    if ( !tracker )
        return "undefined";

    StringSink sink;
    ascii::write(sink, str(&tracker->sequenceItem(), show));
    auto const max = tracker->sequenceItem().maxMatches();
    if ( !max || *max > 1 ) {
        ascii::write(sink, ".[");
        ascii::write(sink, tracker->matches());
        sink.write(']');
    }

    return std::move(sink).str();
}

namespace ascii {
    template <typename Sink, typename T>
    void write(Sink& sink, QuantifiedItem<T> const& item)
    {
        write(sink, str(&item, defaultShow<T>()));
    }

    template <typename Sink, typename T>
    void write(Sink& sink, MatchTracker<T> const& tracker)
    {
        write(sink, str(&tracker, defaultShow<T>()));
    }
} // namespace ascii

} // namespace seqmatch
