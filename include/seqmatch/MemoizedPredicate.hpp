#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>

#include <seqmatch/Stream.hpp>
#include <seqmatch/Types.hpp>

namespace seqmatch {

/**
 * Predicate wrapper that caches verdicts by rendered operands
 *
 * The key is "dest|src" built from the two Show functions, so operands that
 * render identically share a verdict. Copies share one cache, which lets a
 * wrapper be handed to several matcher calls by value. A predicate that
 * throws leaves the cache unchanged.
 */
template <typename Dest, typename Src>
class MemoizedPredicate
{
public:
    using Function = std::function<bool(Dest const&, Src const&)>;

public:
    explicit MemoizedPredicate(Function pred,
                               Show<Dest> showDest = {},
                               Show<Src> showSrc = {})
        : myState(std::make_shared<State>())
    {
        myState->pred = std::move(pred);
        myState->showDest = orDefault(std::move(showDest));
        myState->showSrc = orDefault(std::move(showSrc));
    }

public:
    bool operator () (Dest const& dest, Src const& src) const
    {
        auto key = myState->showDest(dest) + "|" + myState->showSrc(src);
        auto e = myState->cache.find(key);
        if ( e != myState->cache.end() ) {
            ++myState->hits;
            return e->second;
        }

        ++myState->misses;
        bool const ret = myState->pred(dest, src);
        myState->cache.emplace(std::move(key), ret);
        return ret;
    }

public:
    uz hits() const { return myState->hits; }
    uz misses() const { return myState->misses; }
    uz size() const { return myState->cache.size(); }

    void clear()
    {
        myState->cache.clear();
        myState->hits = 0;
        myState->misses = 0;
    }

private:
    struct State
    {
        Function pred;
        Show<Dest> showDest;
        Show<Src> showSrc;
        std::map<std::string, bool> cache;
        uz hits = 0;
        uz misses = 0;
    };

    std::shared_ptr<State> myState;
};

} // namespace seqmatch
