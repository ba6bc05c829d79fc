#include <seqmatch/Trace.hpp>

namespace seqmatch {

//
// TraceSink

TraceSink::~TraceSink() = default;

std::string formatTraceLine(uz indent, uz depth, std::string_view text)
{
    std::string ret(indent, ' ');
    ret += "[acc_sequence] ";
    ret.append(depth, '-');
    ret.append(text.data(), text.size());
    return ret;
}

//
// StreamTrace

StreamTrace::StreamTrace(OutStream& out)
    : myOut(&out)
{
}

void StreamTrace::line(uz indent, uz depth, std::string_view text)
{
    (*myOut)(formatTraceLine(indent, depth, text))();
}

//
// BufferTrace

void BufferTrace::line(uz indent, uz depth, std::string_view text)
{
    myLines.emplace_back(formatTraceLine(indent, depth, text));
}

std::vector<std::string> const& BufferTrace::lines() const
{
    return myLines;
}

bool BufferTrace::contains(std::string_view fragment) const
{
    return count(fragment) != 0;
}

uz BufferTrace::count(std::string_view fragment) const
{
    uz ret = 0;
    for ( auto const& l : myLines )
        if ( l.find(fragment) != std::string::npos )
            ++ret;

    return ret;
}

void BufferTrace::clear()
{
    myLines.clear();
}

} // namespace seqmatch
