#include <seqmatch/Stream.hpp>

namespace seqmatch {

//
// OutStream

OutStream::OutStream(std::ostream& sink) noexcept
    : mySink(&sink)
{
}

OutStream::~OutStream()
{
    flush();
}

OutStream& OutStream::operator () ()
{
    write('\n');
    flush();
    return *this;
}

void OutStream::write(char c)
{
    mySink->put(c);
}

void OutStream::write(std::string_view s)
{
    mySink->write(s.data(), static_cast<std::streamsize>(s.size()));
}

void OutStream::flush()
{
    mySink->flush();
}

} // namespace seqmatch
