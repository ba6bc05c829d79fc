#pragma once

#include <string>

#include <seqmatch/Box.hpp>
#include <seqmatch/QuantifiedItem.hpp>
#include <seqmatch/Types.hpp>

namespace seqmatch {

/**
 * Reduction strategy for a walk over two quantified sequences
 *
 * The traversal consults matches() before pairing two trackers and folds
 * every visited pair through accumulate(). A null tracker stands for
 * "absent": the other side's item is consumed with zero occurrences.
 *
 * Implementations are persistent: accumulate() and copy() return fresh
 * instances and never modify the receiver, so the traversal can hand the
 * same ancestor to several branches and drop the ones that fail.
 */
template <typename Dest, typename Src, typename Value>
class SequenceAccumulator
{
public:
    using DestTracker = MatchTracker<Dest>;
    using SrcTracker = MatchTracker<Src>;
    using ValueType = Value;

public:
    SequenceAccumulator() = default;

    SequenceAccumulator(SequenceAccumulator const&) = default;
    SequenceAccumulator& operator = (SequenceAccumulator const&) = default;

    virtual ~SequenceAccumulator() = default;

public:
    virtual Value const& value() const = 0;

    // False if dest and src cannot be reduced together
    virtual bool matches(DestTracker const* dest, SrcTracker const* src) const = 0;

    // Reduces dest and src into a copy of this
    virtual Box<SequenceAccumulator> accumulate(DestTracker const* dest, SrcTracker const* src) const = 0;

    virtual Box<SequenceAccumulator> copy() const = 0;

    virtual std::string str() const = 0;

    /**
     * Digest of the state that matches() depends on
     *
     * The traversal's failure memo keys rejected states on this value. An
     * accumulator whose matches() ignores its folded value returns the same
     * key for every instance, which is the default.
     */
    virtual u64 memoKey() const { return 0; }
};

namespace ascii {
    template <typename Sink, typename Dest, typename Src, typename Value>
    void write(Sink& sink, SequenceAccumulator<Dest, Src, Value> const& acc)
    {
        sink.write(acc.str());
    }
} // namespace ascii

} // namespace seqmatch
