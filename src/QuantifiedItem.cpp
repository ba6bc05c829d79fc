#include <seqmatch/QuantifiedItem.hpp>

#include <seqmatch/Utilities.hpp>

namespace seqmatch {

//
// Quantifier

Quantifier Quantifier::one()
{
    return Quantifier(1, 1);
}

Quantifier Quantifier::optional()
{
    return Quantifier(0, 1);
}

Quantifier Quantifier::zeroOrMore()
{
    return Quantifier(0, std::nullopt);
}

Quantifier Quantifier::oneOrMore()
{
    return Quantifier(1, std::nullopt);
}

Quantifier Quantifier::atLeast(MatchCount min)
{
    return Quantifier(min, std::nullopt);
}

Quantifier Quantifier::exactly(MatchCount n)
{
    return Quantifier(n, n);
}

Quantifier Quantifier::upTo(MatchCount max)
{
    return Quantifier(0, max);
}

Quantifier Quantifier::between(MatchCount min, MatchCount max)
{
    return Quantifier(min, max);
}

Quantifier::Quantifier(MatchCount min, std::optional<MatchCount> max)
    : myMin(min)
    , myMax(max)
{
    if ( myMax && myMin > *myMax )
        ENFORCEU("quantifier minimum " + std::to_string(myMin)
               + " exceeds maximum " + std::to_string(*myMax));
}

bool Quantifier::isRepeated() const noexcept
{
    return !myMax || *myMax > 1 || (*myMax == 1 && myMin == 0);
}

bool Quantifier::operator == (Quantifier const& rhs) const noexcept
{
    return myMin == rhs.myMin && myMax == rhs.myMax;
}

bool Quantifier::operator != (Quantifier const& rhs) const noexcept
{
    return !operator==(rhs);
}

//
// Misc

std::string str(Quantifier const& q)
{
    StringSink sink;
    ascii::write(sink, q);
    return std::move(sink).str();
}

} // namespace seqmatch
