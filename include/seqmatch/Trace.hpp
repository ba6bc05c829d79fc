#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <seqmatch/Stream.hpp>
#include <seqmatch/Types.hpp>

namespace seqmatch {

/**
 * Receiver of the traversal's search trace
 *
 * indent is the caller's own nesting (a matcher invoked from inside another
 * matcher's predicate passes its recursion count); depth is the traversal's
 * recursion depth. Neither affects the search.
 */
class TraceSink
{
public:
    virtual ~TraceSink();

public:
    virtual void line(uz indent, uz depth, std::string_view text) = 0;
};

std::string formatTraceLine(uz indent, uz depth, std::string_view text);

class StreamTrace : public TraceSink
{
public:
    explicit StreamTrace(OutStream& out);

public:
    void line(uz indent, uz depth, std::string_view text) override;

private:
    OutStream* myOut = nullptr;
};

class BufferTrace : public TraceSink
{
public:
    void line(uz indent, uz depth, std::string_view text) override;

public:
    std::vector<std::string> const& lines() const;
    bool contains(std::string_view fragment) const;
    uz count(std::string_view fragment) const;
    void clear();

private:
    std::vector<std::string> myLines;
};

} // namespace seqmatch
