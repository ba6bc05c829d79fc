#pragma once

#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

#include <seqmatch/Accumulator.hpp>
#include <seqmatch/Box.hpp>
#include <seqmatch/QuantifiedItem.hpp>
#include <seqmatch/Slice.hpp>
#include <seqmatch/Stream.hpp>
#include <seqmatch/Trace.hpp>
#include <seqmatch/Types.hpp>
#include <seqmatch/Utilities.hpp>

namespace seqmatch {

struct TraversalStats
{
    uz steps = 0;
    uz maxDepth = 0;
    uz memoHits = 0;
    uz memoSize = 0;
    bool limitReached = false;
};

struct TraversalOptions
{
    // Receives the search trace; null disables tracing
    TraceSink* trace = nullptr;

    // Caller's recursion depth, used to indent the trace
    uz indent = 0;

    // Maximum number of visited states; 0 is unlimited
    uz stepLimit = 0;

    // Maximum recursion depth; 0 is unlimited
    uz depthLimit = 0;

    // Remember rejected states and skip them when reached again
    bool memoize = false;

    // Filled in when the traversal returns
    TraversalStats* stats = nullptr;
};

/**
 * Backtracking walk over two quantified sequences
 *
 * Each sequence is a chain of states, one per item. A non-repeating item
 * is a single edge to the next state, a repeating item adds a self-loop,
 * and a run of skippable items adds edges that jump over the whole run.
 * The walk advances both chains in lockstep from before their first items
 * and accepts when both reach their ends together. At every step, the
 * candidate successors of each side are "stay" (if the item can match
 * again), "advance", then each jump across a skippable run; the cross
 * product is explored depth-first in that order, which makes repeating
 * items greedy. The first accepting walk wins.
 *
 * Items jumped over are folded against absence, in order, on the branch
 * that jumps. Items left over once one side has ended must be skippable
 * and are folded against absence one at a time.
 */
template <typename Dest, typename Src, typename Value>
class Traversal
{
public:
    using Accumulator = SequenceAccumulator<Dest, Src, Value>;
    using DestTracker = MatchTracker<Dest>;
    using SrcTracker = MatchTracker<Src>;

public:
    Traversal(Slice<DestTracker const> dest,
              Slice<SrcTracker const> src,
              TraversalOptions const& options,
              Show<Dest> showDest,
              Show<Src> showSrc)
        : myDest(dest)
        , mySrc(src)
        , myOptions(options)
        , myShowDest(orDefault(std::move(showDest)))
        , myShowSrc(orDefault(std::move(showSrc)))
    {
    }

    Traversal(Traversal const&) = delete;
    void operator = (Traversal const&) = delete;

public:
    Box<Accumulator> run(Accumulator const& acc)
    {
        myStats = TraversalStats();
        myFailures.clear();

        auto const header = myOptions.trace ? sequenceStr() : std::string();
        trace(0, [&] { return header; });

        auto ret = step(-1, -1, std::nullopt, std::nullopt, acc.copy(), 0);

        trace(0, [&] {
            return header + " ==> " + (ret ? ret->str() : std::string("undefined"));
        });

        myStats.memoSize = myFailures.size();
        if ( myOptions.stats )
            *myOptions.stats = myStats;

        return ret;
    }

    TraversalStats const& stats() const
    {
        return myStats;
    }

private:
    template <typename T>
    struct Next
    {
        sz index;
        std::optional<MatchTracker<T>> tracker;
    };

    using FailureKey = std::tuple<sz, sz, MatchCount, MatchCount, u64>;

    template <typename T>
    static std::optional<MatchTracker<T>> at(Slice<MatchTracker<T> const> seq, sz index)
    {
        if ( index < 0 || index >= static_cast<sz>(seq.card()) )
            return std::nullopt;

        return seq[index];
    }

    template <typename T>
    static MatchTracker<T> const* ptr(std::optional<MatchTracker<T>> const& t)
    {
        return t ? &*t : nullptr;
    }

    // Past its maximum a tracker is done; unbounded trackers never are
    template <typename T>
    static MatchCount effectiveCount(std::optional<MatchTracker<T>> const& t)
    {
        if ( !t || !t->sequenceItem().maxMatches() )
            return 0;

        return t->matches();
    }

    template <typename T>
    static std::vector<Next<T>> nextSteps(sz index,
                                          std::optional<MatchTracker<T>> const& matched,
                                          Slice<MatchTracker<T> const> seq)
    {
        std::vector<Next<T>> ret;
        if ( matched && matched->hasMoreMatches() )
            ret.push_back({ index, matched });

        ret.push_back({ index + 1, at(seq, index + 1) });

        auto const last = static_cast<sz>(seq.card()) - 1;
        for ( auto k = index + 1; k < last && seq[k].isSkippable(); ++k )
            ret.push_back({ k + 1, seq[k + 1] });

        return ret;
    }

    Box<Accumulator> step(sz i, sz j,
                          std::optional<DestTracker> const& a,
                          std::optional<SrcTracker> const& b,
                          Box<Accumulator> acc,
                          uz depth)
    {
        ++myStats.steps;
        if ( depth > myStats.maxDepth )
            myStats.maxDepth = depth;

        if ( myStats.limitReached )
            return nullptr;

        if ( (myOptions.stepLimit && myStats.steps > myOptions.stepLimit)
          || (myOptions.depthLimit && depth > myOptions.depthLimit) )
        {
            myStats.limitReached = true;
            trace(depth, [] { return std::string("[ABANDON] search limit reached"); });
            return nullptr;
        }

        trace(depth, [&] {
            return "step(" + std::to_string(i) + ": " + str(ptr(a), myShowDest)
                 + ", " + std::to_string(j) + ": " + str(ptr(b), myShowSrc) + ")";
        });

        FailureKey key(i, j, effectiveCount(a), effectiveCount(b), acc->memoKey());
        if ( myOptions.memoize && myFailures.count(key) ) {
            ++myStats.memoHits;
            trace(depth, [] { return std::string("[REJECT] known dead end"); });
            return nullptr;
        }

        auto ret = explore(i, j, a, b, std::move(acc), depth);
        if ( !ret && myOptions.memoize && !myStats.limitReached )
            myFailures.insert(key);

        return ret;
    }

    Box<Accumulator> explore(sz i, sz j,
                             std::optional<DestTracker> const& a,
                             std::optional<SrcTracker> const& b,
                             Box<Accumulator> acc,
                             uz depth)
    {
        if ( i >= 0 && j >= 0 ) {
            if ( !a && !b ) {
                trace(depth, [] { return std::string("[ACCEPT] both sequences ended"); });
                return acc;
            }

            if ( !a ) {
                if ( !b->isSkippable() ) {
                    trace(depth, [] { return std::string("[REJECT] dest ended, src item is required"); });
                    return nullptr;
                }

                if ( !acc->matches(nullptr, &*b) ) {
                    trace(depth, [] { return std::string("[REJECT] dest ended, src item refused as empty"); });
                    return nullptr;
                }

                trace(depth, [] { return std::string("* dest ended, src item matches zero"); });
                return step(i, j + 1, std::nullopt, at(mySrc, j + 1),
                            acc->accumulate(nullptr, &*b), depth + 1);
            }

            if ( !b ) {
                if ( !a->isSkippable() ) {
                    trace(depth, [] { return std::string("[REJECT] src ended, dest item is required"); });
                    return nullptr;
                }

                if ( !acc->matches(&*a, nullptr) ) {
                    trace(depth, [] { return std::string("[REJECT] src ended, dest item refused as empty"); });
                    return nullptr;
                }

                trace(depth, [] { return std::string("* src ended, dest item matches zero"); });
                return step(i + 1, j, at(myDest, i + 1), std::nullopt,
                            acc->accumulate(&*a, nullptr), depth + 1);
            }

            if ( !acc->matches(&*a, &*b) ) {
                trace(depth, [] { return std::string("[REJECT] items do not correspond"); });
                return nullptr;
            }
        }

        std::optional<DestTracker> aMatched;
        if ( a )
            aMatched = a->matched();

        std::optional<SrcTracker> bMatched;
        if ( b )
            bMatched = b->matched();

        auto const aSteps = nextSteps(i, aMatched, myDest);
        auto const bSteps = nextSteps(j, bMatched, mySrc);

        std::vector<std::pair<Next<Dest> const*, Next<Src> const*>> steps;
        for ( auto const& as : aSteps )
            for ( auto const& bs : bSteps )
                if ( as.index != i || bs.index != j )
                    steps.emplace_back(&as, &bs);

        trace(depth, [&] {
            std::string line = "* steps:";
            for ( auto const& s : steps )
                line += " (" + std::to_string(s.first->index) + ", " + std::to_string(s.second->index) + ")";
            return line;
        });

        for ( auto const& [as, bs] : steps ) {
            // the pair is folded as it stood when matches() accepted it
            auto next = i >= 0 && j >= 0 ? acc->accumulate(ptr(a), ptr(b))
                                         : acc->copy();

            for ( auto k = i + 1; k < as->index; ++k )
                next = next->accumulate(&myDest[k], nullptr);

            for ( auto k = j + 1; k < bs->index; ++k )
                next = next->accumulate(nullptr, &mySrc[k]);

            if ( auto ret = step(as->index, bs->index, as->tracker, bs->tracker, std::move(next), depth + 1) )
                return ret;

            if ( myStats.limitReached )
                return nullptr;
        }

        trace(depth, [] { return std::string("[REJECT] no successor leads to a match"); });
        return nullptr;
    }

    std::string sequenceStr() const
    {
        auto join = [](auto const& seq, auto const& show) {
            std::string ret = "[";
            for ( uz k = 0; k < seq.card(); ++k ) {
                if ( k )
                    ret += ';';
                ret += str(&seq[k], show);
            }
            return ret + "]";
        };

        return join(myDest, myShowDest) + " ==?== " + join(mySrc, myShowSrc);
    }

    template <typename F>
    void trace(uz depth, F&& text)
    {
        if ( myOptions.trace )
            myOptions.trace->line(myOptions.indent, depth, text());
    }

private:
    Slice<DestTracker const> myDest;
    Slice<SrcTracker const> mySrc;
    TraversalOptions myOptions;
    Show<Dest> myShowDest;
    Show<Src> myShowSrc;

    TraversalStats myStats;
    std::set<FailureKey> myFailures;
};

/**
 * Searches for a walk pairing dest with src
 *
 * Returns the accumulator of the first accepting walk, or an empty box if
 * no walk exists. An accepted accumulator whose value is false or empty is
 * still a match.
 */
template <typename Dest, typename Src, typename Value>
Box<SequenceAccumulator<Dest, Src, Value>>
traverseAccumulateSequence(Slice<MatchTracker<nondeduced_t<Dest>> const> dest,
                           Slice<MatchTracker<nondeduced_t<Src>> const> src,
                           SequenceAccumulator<Dest, Src, Value> const& acc,
                           TraversalOptions const& options = TraversalOptions(),
                           Show<nondeduced_t<Dest>> showDest = {},
                           Show<nondeduced_t<Src>> showSrc = {})
{
    Traversal<Dest, Src, Value> traversal(dest, src, options, std::move(showDest), std::move(showSrc));
    return traversal.run(acc);
}

} // namespace seqmatch
