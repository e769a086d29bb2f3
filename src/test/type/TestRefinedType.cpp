#include <boost/test/unit_test.hpp>
#include <vt/type/Newtype.hpp>
#include <string>
#include <sstream>
#include <type_traits>

namespace {

struct PercentRange {
  static bool check(int value) { return value >= 0 && value <= 100; }
  static std::string describe(int value) { return "percentage out of range: " + std::to_string(value); }
};

struct NonEmpty {
  static bool check(const std::string& value) { return !value.empty(); }
  static std::string describe(const std::string&) { return "empty name"; }
};

VT_REFINED_NEWTYPE(Percent, int, PercentRange);
VT_REFINED_NEWTYPE(Name, std::string, NonEmpty);

static_assert(!std::is_constructible_v<Percent, int>);
static_assert(!std::is_default_constructible_v<Percent>);
static_assert(std::is_copy_constructible_v<Percent>);
static_assert(sizeof(Percent) == sizeof(int));
static_assert(sizeof(Name) == sizeof(std::string));
static_assert(!std::is_same_v<Name, vt::type::NamedType<"Name", std::string>>);

}

BOOST_AUTO_TEST_SUITE(RefinedTypeTests)

BOOST_AUTO_TEST_CASE(AcceptsValidValue) {
    auto percent = Percent::make(42);
    BOOST_REQUIRE(percent);
    BOOST_CHECK_EQUAL(percent.value().value(), 42);
    BOOST_CHECK_EQUAL(Percent::make(0).value().value(), 0);
    BOOST_CHECK_EQUAL(Percent::make(100).value().value(), 100);
}

BOOST_AUTO_TEST_CASE(RejectsInvalidValue) {
    auto percent = Percent::make(101);
    BOOST_REQUIRE(!percent);
    BOOST_CHECK_EQUAL(percent.error().typeName(), "Percent");
    BOOST_CHECK_EQUAL(percent.error().input(), "101");
    BOOST_CHECK_EQUAL(percent.error().what(), std::string("percentage out of range: 101"));
}

BOOST_AUTO_TEST_CASE(TextInputIsKeptVerbatim) {
    auto name = Name::make("");
    BOOST_REQUIRE(name.has_error());
    BOOST_CHECK_EQUAL(name.error().input(), "");
    BOOST_CHECK_EQUAL(name.error().message(), "empty name");
}

BOOST_AUTO_TEST_CASE(FromThrowsValidationError) {
    BOOST_CHECK_EQUAL(Percent::from(7).value(), 7);
    BOOST_CHECK_THROW(Percent::from(-1), vt::type::ValidationError);
    BOOST_CHECK_THROW(Percent::from(-1), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(ValueOfFailedResultThrows) {
    auto percent = Percent::make(200);
    BOOST_CHECK_THROW(percent.value(), vt::type::outcome::bad_result_access_with<vt::type::ValidationError>);
}

BOOST_AUTO_TEST_CASE(EqualityAndOrdering) {
    BOOST_CHECK(Percent::from(5) == Percent::from(5));
    BOOST_CHECK(Percent::from(5) != Percent::from(6));
    BOOST_CHECK(Percent::from(5) < Percent::from(6));
    BOOST_CHECK(Name::from("a") < Name::from("b"));
}

BOOST_AUTO_TEST_CASE(CopiesKeepTheValue) {
    auto original = Name::from("vt");
    auto copy = original;
    BOOST_CHECK(copy == original);

    std::ostringstream oss;
    oss << copy;
    BOOST_CHECK_EQUAL(oss.str(), "Name(vt)");
}

BOOST_AUTO_TEST_CASE(MovedFromStillSatisfiesCheck) {
    auto source = Name::from("vt");
    Name moved = std::move(source);
    BOOST_CHECK_EQUAL(moved.value(), "vt");
    BOOST_CHECK_EQUAL(source.value(), "vt");
    BOOST_CHECK(NonEmpty::check(source.value()));

    auto target = Name::from("other");
    auto donor = Name::from("long enough to live on the heap, not in the small buffer");
    target = std::move(donor);
    BOOST_CHECK_EQUAL(target.value(), "long enough to live on the heap, not in the small buffer");
    BOOST_CHECK(NonEmpty::check(donor.value()));
    BOOST_CHECK(donor == target);

    auto percent = Percent::from(55);
    Percent other = std::move(percent);
    BOOST_CHECK(PercentRange::check(percent.value()));
    BOOST_CHECK(percent == other);
}

BOOST_AUTO_TEST_SUITE_END()
