#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <seqmatch/Accumulator.hpp>
#include <seqmatch/Box.hpp>
#include <seqmatch/QuantifiedItem.hpp>
#include <seqmatch/Stream.hpp>
#include <seqmatch/Traversal.hpp>

namespace seqmatch {

template <typename Dest, typename Src>
using Predicate = std::function<bool(Dest const&, Src const&)>;

template <typename Dest, typename Src, typename Common>
using GetCommon = std::function<std::optional<QuantifiedItem<Common>>(QuantifiedItem<Dest> const*,
                                                                      QuantifiedItem<Src> const*)>;

/**
 * Correspondence test shared by the existence and grouping strategies
 *
 * Two present items correspond if both can still match and the predicate
 * accepts them. A present item corresponds to absence if it may match zero
 * times.
 */
template <typename Dest, typename Src>
bool correspond(Predicate<Dest, Src> const& pred,
                MatchTracker<Dest> const* dest,
                MatchTracker<Src> const* src)
{
    if ( !dest && !src )
        return true;

    if ( dest && src )
        return dest->hasMoreMatches()
            && src->hasMoreMatches()
            && pred(dest->item(), src->item());

    if ( src )
        return src->isSkippable();

    return dest->isSkippable();
}

//
// ExistenceAccumulator

template <typename Dest, typename Src>
class ExistenceAccumulator : public SequenceAccumulator<Dest, Src, bool>
{
public:
    using Base = SequenceAccumulator<Dest, Src, bool>;
    using typename Base::DestTracker;
    using typename Base::SrcTracker;

public:
    explicit ExistenceAccumulator(Predicate<Dest, Src> pred)
        : myPredicate(std::make_shared<Predicate<Dest, Src> const>(std::move(pred)))
    {
    }

public:
    bool const& value() const override
    {
        return myValue;
    }

    bool matches(DestTracker const* dest, SrcTracker const* src) const override
    {
        return correspond(*myPredicate, dest, src);
    }

    Box<Base> accumulate(DestTracker const* dest, SrcTracker const* src) const override
    {
        auto ret = mk<ExistenceAccumulator>(*this);
        if ( matches(dest, src) )
            ret->myValue = true;

        return ret;
    }

    Box<Base> copy() const override
    {
        return mk<ExistenceAccumulator>(*this);
    }

    std::string str() const override
    {
        return myValue ? "true" : "false";
    }

private:
    std::shared_ptr<Predicate<Dest, Src> const> myPredicate;
    bool myValue = false;
};

//
// GroupingAccumulator

template <typename Dest, typename Src>
struct DestItemMatches
{
    QuantifiedItem<Dest> const* destItem = nullptr;
    std::vector<QuantifiedItem<Src> const*> matchedSrcItems;
};

/**
 * Collects, per destination item, the source items it absorbed
 *
 * Groups appear in destination order. Consecutive pairings of the same
 * destination item extend one group; a destination item matched zero times
 * gets an empty group. Source items matched zero times leave no trace.
 * Items are identified by address, so the groups refer into the caller's
 * sequences.
 */
template <typename Dest, typename Src>
class GroupingAccumulator : public SequenceAccumulator<Dest, Src, std::vector<DestItemMatches<Dest, Src>>>
{
public:
    using Group = DestItemMatches<Dest, Src>;
    using Base = SequenceAccumulator<Dest, Src, std::vector<Group>>;
    using typename Base::DestTracker;
    using typename Base::SrcTracker;

public:
    explicit GroupingAccumulator(Predicate<Dest, Src> pred,
                                 Show<Dest> showDest = {},
                                 Show<Src> showSrc = {})
        : myPredicate(std::make_shared<Predicate<Dest, Src> const>(std::move(pred)))
        , myShowDest(orDefault(std::move(showDest)))
        , myShowSrc(orDefault(std::move(showSrc)))
    {
    }

public:
    std::vector<Group> const& value() const override
    {
        return myGroups;
    }

    bool matches(DestTracker const* dest, SrcTracker const* src) const override
    {
        return correspond(*myPredicate, dest, src);
    }

    Box<Base> accumulate(DestTracker const* dest, SrcTracker const* src) const override
    {
        auto ret = mk<GroupingAccumulator>(*this);
        if ( !dest )
            return ret;

        auto const* destItem = &dest->sequenceItem();
        auto& groups = ret->myGroups;
        bool const extend = !groups.empty() && groups.back().destItem == destItem;

        if ( src ) {
            if ( extend )
                groups.back().matchedSrcItems.push_back(&src->sequenceItem());
            else
                groups.push_back({ destItem, { &src->sequenceItem() } });
        }
        else if ( !extend ) {
            groups.push_back({ destItem, {} });
        }

        return ret;
    }

    Box<Base> copy() const override
    {
        return mk<GroupingAccumulator>(*this);
    }

    std::string str() const override
    {
        std::string ret = "{";
        for ( uz g = 0; g < myGroups.size(); ++g ) {
            if ( g )
                ret += ';';

            ret += seqmatch::str(myGroups[g].destItem, myShowDest);
            ret += " == [";
            auto const& srcs = myGroups[g].matchedSrcItems;
            for ( uz s = 0; s < srcs.size(); ++s ) {
                if ( s )
                    ret += ';';
                ret += seqmatch::str(srcs[s], myShowSrc);
            }
            ret += ']';
        }

        return ret + "}";
    }

private:
    std::shared_ptr<Predicate<Dest, Src> const> myPredicate;
    Show<Dest> myShowDest;
    Show<Src> myShowSrc;
    std::vector<Group> myGroups;
};

//
// CommonSequenceAccumulator

/**
 * Merges two sequences into the sequence of their common items
 *
 * getCommon decides both whether a pair (or an item against absence) is
 * admissible and what it merges into. A repeated common item equal to the
 * repeated item just before it is absorbed by that entry, so a run of
 * matches against one repeating item yields one entry.
 */
template <typename Dest, typename Src, typename Common>
class CommonSequenceAccumulator
    : public SequenceAccumulator<Dest, Src, std::vector<QuantifiedItem<Common>>>
{
public:
    using Base = SequenceAccumulator<Dest, Src, std::vector<QuantifiedItem<Common>>>;
    using typename Base::DestTracker;
    using typename Base::SrcTracker;

public:
    explicit CommonSequenceAccumulator(GetCommon<Dest, Src, Common> getCommon,
                                       Show<Common> showCommon = {})
        : myGetCommon(std::make_shared<GetCommon<Dest, Src, Common> const>(std::move(getCommon)))
        , myShowCommon(orDefault(std::move(showCommon)))
    {
    }

public:
    std::vector<QuantifiedItem<Common>> const& value() const override
    {
        return myItems;
    }

    bool matches(DestTracker const* dest, SrcTracker const* src) const override
    {
        return common(dest, src).has_value();
    }

    Box<Base> accumulate(DestTracker const* dest, SrcTracker const* src) const override
    {
        auto ret = mk<CommonSequenceAccumulator>(*this);
        auto c = common(dest, src);
        if ( !c )
            return ret;

        auto& items = ret->myItems;
        bool const coalesce = !items.empty()
                           && c->isRepeated()
                           && items.back().isRepeated()
                           && items.back() == *c;
        if ( !coalesce )
            items.push_back(std::move(*c));

        return ret;
    }

    Box<Base> copy() const override
    {
        return mk<CommonSequenceAccumulator>(*this);
    }

    std::string str() const override
    {
        std::string ret = "[";
        for ( uz k = 0; k < myItems.size(); ++k ) {
            if ( k )
                ret += ';';
            ret += seqmatch::str(&myItems[k], myShowCommon);
        }

        return ret + "]";
    }

private:
    std::optional<QuantifiedItem<Common>> common(DestTracker const* dest, SrcTracker const* src) const
    {
        return (*myGetCommon)(dest ? &dest->sequenceItem() : nullptr,
                              src ? &src->sequenceItem() : nullptr);
    }

private:
    std::shared_ptr<GetCommon<Dest, Src, Common> const> myGetCommon;
    Show<Common> myShowCommon;
    std::vector<QuantifiedItem<Common>> myItems;
};

//
// entry points

/**
 * True if a walk pairs dest with src
 *
 * Two empty sequences form a walk that folds nothing; they match.
 */
template <typename Dest, typename Src>
bool matchSequence(std::vector<QuantifiedItem<Dest>> const& dest,
                   std::vector<QuantifiedItem<Src>> const& src,
                   Predicate<nondeduced_t<Dest>, nondeduced_t<Src>> destMatchesSrc,
                   TraversalOptions const& options = TraversalOptions(),
                   Show<nondeduced_t<Dest>> showDest = {},
                   Show<nondeduced_t<Src>> showSrc = {})
{
    auto const destTrackers = trackers(dest);
    auto const srcTrackers = trackers(src);

    auto acc = traverseAccumulateSequence<Dest, Src, bool>(
        destTrackers, srcTrackers,
        ExistenceAccumulator<Dest, Src>(std::move(destMatchesSrc)),
        options, std::move(showDest), std::move(showSrc));

    if ( !acc )
        return false;

    return acc->value() || (dest.empty() && src.empty());
}

/**
 * Groups of source items absorbed by each destination item
 *
 * Returns nothing when no walk exists. The groups point into dest and src,
 * which must outlive the result.
 */
template <typename Dest, typename Src>
std::optional<std::vector<DestItemMatches<Dest, Src>>>
matchAccumulateSequence(std::vector<QuantifiedItem<Dest>> const& dest,
                        std::vector<QuantifiedItem<Src>> const& src,
                        Predicate<nondeduced_t<Dest>, nondeduced_t<Src>> destMatchesSrc,
                        TraversalOptions const& options = TraversalOptions(),
                        Show<nondeduced_t<Dest>> showDest = {},
                        Show<nondeduced_t<Src>> showSrc = {})
{
    auto const destTrackers = trackers(dest);
    auto const srcTrackers = trackers(src);

    auto acc = traverseAccumulateSequence<Dest, Src, std::vector<DestItemMatches<Dest, Src>>>(
        destTrackers, srcTrackers,
        GroupingAccumulator<Dest, Src>(std::move(destMatchesSrc), showDest, showSrc),
        options, showDest, showSrc);

    if ( !acc )
        return std::nullopt;

    return acc->value();
}

template <typename Dest, typename Src, typename Common>
std::optional<std::vector<QuantifiedItem<Common>>>
getCommonSequence(std::vector<QuantifiedItem<Dest>> const& dest,
                  std::vector<QuantifiedItem<Src>> const& src,
                  GetCommon<nondeduced_t<Dest>, nondeduced_t<Src>, Common> getCommon,
                  TraversalOptions const& options = TraversalOptions(),
                  Show<nondeduced_t<Dest>> showDest = {},
                  Show<nondeduced_t<Src>> showSrc = {},
                  Show<Common> showCommon = {})
{
    auto const destTrackers = trackers(dest);
    auto const srcTrackers = trackers(src);

    auto acc = traverseAccumulateSequence<Dest, Src, std::vector<QuantifiedItem<Common>>>(
        destTrackers, srcTrackers,
        CommonSequenceAccumulator<Dest, Src, Common>(std::move(getCommon), std::move(showCommon)),
        options, std::move(showDest), std::move(showSrc));

    if ( !acc )
        return std::nullopt;

    return acc->value();
}

} // namespace seqmatch
