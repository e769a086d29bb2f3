#include <boost/test/unit_test.hpp>
#include <vt/type/Newtype.hpp>
#include <vt/type/TypeList.hpp>
#include <string>
#include <sstream>
#include <unordered_set>
#include <type_traits>

namespace {

VT_NEWTYPE(Quantity, int);
VT_NEWTYPE(Level, int);
VT_NEWTYPE(Ticker, std::string);

static_assert(!std::is_same_v<Quantity, Level>);
static_assert(!std::is_convertible_v<Quantity, Level>);
static_assert(!std::is_convertible_v<int, Quantity>);
static_assert(!std::is_convertible_v<Quantity, int>);
static_assert(std::is_constructible_v<Quantity, int>);
static_assert(sizeof(Ticker) == sizeof(std::string));
static_assert(std::is_trivially_copyable_v<Quantity>);

}

BOOST_AUTO_TEST_SUITE(NamedTypeTests)

BOOST_AUTO_TEST_CASE(ValueIsStoredAsIs) {
    Ticker ticker("AAPL");
    BOOST_CHECK_EQUAL(ticker.value(), "AAPL");
    BOOST_CHECK_EQUAL(Ticker::make("").value(), "");
    BOOST_CHECK_EQUAL(Quantity(42).value(), 42);
}

BOOST_AUTO_TEST_CASE(EqualityDelegatesToValue) {
    BOOST_CHECK(Ticker("AAPL") == Ticker("AAPL"));
    BOOST_CHECK(Ticker("AAPL") != Ticker("MSFT"));
    BOOST_CHECK(Quantity(1) < Quantity(2));
    BOOST_CHECK(Quantity(3) >= Quantity(3));
}

BOOST_AUTO_TEST_CASE(HashDelegatesToValue) {
    BOOST_CHECK_EQUAL(std::hash<Ticker>{}(Ticker("IBM")), std::hash<std::string>{}("IBM"));

    std::unordered_set<Ticker> tickers;
    tickers.insert(Ticker("IBM"));
    tickers.insert(Ticker("IBM"));
    tickers.insert(Ticker("SAP"));
    BOOST_CHECK_EQUAL(tickers.size(), 2);
    BOOST_CHECK(tickers.contains(Ticker("SAP")));
}

BOOST_AUTO_TEST_CASE(ShowsTagAndValue) {
    std::ostringstream oss;
    oss << Ticker("IBM") << ' ' << Quantity(7);
    BOOST_CHECK_EQUAL(oss.str(), "Ticker(IBM) Quantity(7)");
}

BOOST_AUTO_TEST_CASE(NameTagIsTheDeclaredName) {
    BOOST_CHECK_EQUAL(Quantity::name_tag(), "Quantity");
    BOOST_CHECK_EQUAL(Level::name_tag(), "Level");
    BOOST_CHECK_EQUAL(Ticker::size(), sizeof(std::string));
}

BOOST_AUTO_TEST_CASE(DistinctFields) {
    BOOST_CHECK((vt::type::AllDistinct<vt::type::type_list<Quantity, Level, Ticker>>()));
    BOOST_CHECK(!(vt::type::AllDistinct<vt::type::type_list<Quantity, Level, Quantity>>()));
}

BOOST_AUTO_TEST_SUITE_END()
