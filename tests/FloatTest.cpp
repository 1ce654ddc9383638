#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE FloatTest

#include <cmath>
#include <cstdint>
#include <limits>

#include <boost/test/unit_test.hpp>

#include "arith/Float.hpp"

using namespace arith;

namespace{
	//! Restores the process-wide AReal defaults on scope exit
	struct DefaultsGuard{
		DefaultsGuard(): precision(AReal::defaultPrecision()), rounding(AReal::defaultRounding()){}
		~DefaultsGuard(){
			AReal::setDefaultPrecision(precision);
			AReal::setDefaultRounding(rounding);
		}

		std::size_t precision;
		AReal::Rounding rounding;
	};
}

BOOST_AUTO_TEST_CASE(TestFieldMetadata)
{
	auto &R = RDF::instance();
	BOOST_CHECK_EQUAL(R.toString(), "Floats");
	BOOST_CHECK_EQUAL(R.characteristic(), 0);
	BOOST_CHECK(!R.isExactType());
	BOOST_CHECK(R.isDomainType());
	BOOST_CHECK(R.baseRing() == nullptr);
	BOOST_CHECK(&parentOf(2.5) == &R);

	auto &RR_ = RR::instance();
	BOOST_CHECK(&parentOf(AReal(1.0)) == &RR_);
	BOOST_CHECK(!RR_.isExactType());
	BOOST_CHECK(RR_.zero().isZero());
	BOOST_CHECK(RR_.one() == AReal(1.0));
}

BOOST_AUTO_TEST_CASE(TestConstruction)
{
	auto &R = RDF::instance();
	BOOST_CHECK_EQUAL(R.fromInteger(std::int64_t(-3)), -3.0);
	BOOST_CHECK_EQUAL(R.fromRational(Rational<std::int64_t>(1, 4)), 0.25);
	BOOST_CHECK_EQUAL(R.fromFloat(1.5), 1.5);

	// integers and ratios beyond 64 bits convert instead of overflowing
	AInt big(std::string("1267650600228229401496703205376"));
	BOOST_CHECK_EQUAL(R.fromInteger(big), std::ldexp(1.0, 100));
	BOOST_CHECK_EQUAL(R.fromInteger(-big), -std::ldexp(1.0, 100));
	BOOST_CHECK_EQUAL(R.fromInteger(AInt(std::numeric_limits<std::uint64_t>::max())), std::ldexp(1.0, 64) - 2048.0);
	BOOST_CHECK_EQUAL(R.fromRational(Rational<AInt>(AInt(1), big)), std::ldexp(1.0, -100));
	BOOST_CHECK_EQUAL(R.fromRational(Rational<AInt>(big * big * AInt(3), big * AInt(4))), 0.75 * std::ldexp(1.0, 100));
	BOOST_CHECK_EQUAL(R.fromRational(Rational<AInt>(AInt(-3), AInt(8))), -0.375);

	auto &RR_ = RR::instance();
	BOOST_CHECK(RR_.fromInteger(AInt(std::string("1267650600228229401496703205376"))) == AReal(std::ldexp(1.0, 100)));
	BOOST_CHECK(RR_.fromRational(Rational<AInt>(AInt(1), AInt(4))) == AReal(0.25));
	BOOST_CHECK(RR_.fromInteger((std::int64_t(1) << 40) + 1) == AReal(std::ldexp(1.0, 40) + 1.0));
	BOOST_CHECK(RR_.fromInteger(std::numeric_limits<std::int64_t>::min()) == AReal(-std::ldexp(1.0, 63)));
}

BOOST_AUTO_TEST_CASE(TestGcd)
{
	BOOST_CHECK_EQUAL(gcd(0.0, 0.0), 0.0);
	BOOST_CHECK_EQUAL(gcd(0.0, 2.5), 1.0);
	BOOST_CHECK_EQUAL(gcd(-3.0, 0.0), 1.0);

	BOOST_CHECK(gcd(AReal(0.0), AReal(0.0)).isZero());
	BOOST_CHECK(gcd(AReal(0.5), AReal(0.0)) == AReal(1.0));
	BOOST_CHECK_EQUAL(gcd(AReal(0.5, 64), AReal(0.0, 64)).precision(), 64u);
}

BOOST_AUTO_TEST_CASE(TestDivides)
{
	auto res = divides(3.0, 2.0);
	BOOST_CHECK(res.first);
	BOOST_CHECK_EQUAL(res.second, 1.5);

	auto byZero = divides(3.0, 0.0);
	BOOST_CHECK(!byZero.first);
	BOOST_CHECK_EQUAL(byZero.second, 0.0);

	auto realByZero = divides(AReal(3.0), AReal(0.0));
	BOOST_CHECK(!realByZero.first);
	BOOST_CHECK(realByZero.second.isZero());

	auto real = divides(AReal(3.0), AReal(2.0));
	BOOST_CHECK(real.first);
	BOOST_CHECK(real.second == AReal(1.5));

	auto qr = divrem(3.0, 2.0);
	BOOST_CHECK_EQUAL(qr.first, 1.5);
	BOOST_CHECK_EQUAL(qr.second, 0.0);
	BOOST_CHECK_EQUAL(div(3.0, 2.0), 1.5);
}

BOOST_AUTO_TEST_CASE(TestDivexact)
{
	BOOST_CHECK_EQUAL(divexact(3.0, 2.0), 1.5);
	BOOST_CHECK_THROW(divexact(3.0, 0.0), DivisionByZero);
	BOOST_CHECK(std::isinf(divexact(3.0, 0.0, false)));
	BOOST_CHECK(divexact(AReal(3.0), AReal(0.0), false).isInf());
	BOOST_CHECK_THROW(divexact(AReal(3.0), AReal(0.0)), DivisionByZero);

	BOOST_CHECK_EQUAL(divexact(3.0, std::int64_t(2)), 1.5);
	BOOST_CHECK_EQUAL(divexact(std::int64_t(3), 2.0), 1.5);
	BOOST_CHECK_EQUAL(divexact(3.0, Rational<std::int64_t>(1, 4)), 12.0);
	BOOST_CHECK_EQUAL(divexact(Rational<std::int64_t>(1, 4), 2.0), 0.125);

	BOOST_CHECK(divexact(AReal(3.0), AInt(2)) == AReal(1.5));
	BOOST_CHECK(divexact(AInt(3), AReal(2.0)) == AReal(1.5));
	BOOST_CHECK(divexact(AReal(3.0), Rational<AInt>(AInt(1), AInt(4))) == AReal(12.0));
	BOOST_CHECK(divexact(Rational<AInt>(AInt(1), AInt(4)), AReal(2.0)) == AReal(0.125));
	BOOST_CHECK_THROW(divexact(AReal(3.0), AInt(0)), DivisionByZero);

	AInt big(std::string("1267650600228229401496703205376"));
	BOOST_CHECK_EQUAL(divexact(std::ldexp(1.0, 101), big), 2.0);
	BOOST_CHECK_EQUAL(divexact(big, 0.5), std::ldexp(1.0, 101));
	BOOST_CHECK_EQUAL(divexact(3.0, Rational<AInt>(AInt(3), big)), std::ldexp(1.0, 100));
	BOOST_CHECK_EQUAL(divexact(Rational<AInt>(AInt(1), AInt(4)), 2.0), 0.125);
	BOOST_CHECK_THROW(divexact(3.0, AInt(0)), DivisionByZero);
	BOOST_CHECK(std::isinf(divexact(3.0, AInt(0), false)));
}

BOOST_AUTO_TEST_CASE(TestSquareRoot)
{
	BOOST_CHECK_EQUAL(arith::sqrt(4.0), 2.0);
	BOOST_CHECK(std::isnan(arith::sqrt(-1.0)));

	auto root = arith::sqrt(AReal(2.0, 128));
	BOOST_CHECK_EQUAL(root.precision(), 128u);
	BOOST_CHECK_CLOSE(root.toDouble(), std::sqrt(2.0), 1e-12);
	BOOST_CHECK(arith::sqrt(AReal(-1.0)).isNan());
}

BOOST_AUTO_TEST_CASE(TestUnits)
{
	BOOST_CHECK(isUnit(0.5));
	BOOST_CHECK(!isUnit(0.0));
	BOOST_CHECK(!isUnit(AReal(0.0)));
	BOOST_CHECK_EQUAL(canonicalUnit(-2.0), -2.0);
}

BOOST_AUTO_TEST_CASE(TestExpressify)
{
	auto neg = expressify(-2.5);
	auto unary = dynamic_cast<Exprs::UnaryOp*>(neg.get());
	BOOST_REQUIRE(unary != nullptr);
	BOOST_CHECK_EQUAL(unary->op, "-");
	BOOST_CHECK_EQUAL(unary->operand->toString(), "2.5");
	BOOST_CHECK_EQUAL(neg->toString(), "-2.5");

	BOOST_CHECK(dynamic_cast<Exprs::Token*>(expressify(0.1).get()) != nullptr);
	BOOST_CHECK_EQUAL(expressify(0.1)->toString(), "0.1");
	BOOST_CHECK_EQUAL(expressify(3.0)->toString(), "3.0");
	BOOST_CHECK_EQUAL(expressify(1e300)->toString(), "1e+300");

	BOOST_CHECK_EQUAL(expressify(AReal(-0.125))->toString(), "-0.125");
	BOOST_CHECK_EQUAL(expressify(AReal(100.0))->toString(), "100.0");
}

BOOST_AUTO_TEST_CASE(TestARealToString)
{
	BOOST_CHECK_EQUAL(AReal(2.5).toString(), "2.5");
	BOOST_CHECK_EQUAL(AReal(0.0).toString(), "0.0");
	BOOST_CHECK_EQUAL(AReal(-0.0).toString(), "-0.0");
	BOOST_CHECK_EQUAL(AReal(1.0 / 1024).toString(), "0.0009765625");
	BOOST_CHECK_EQUAL(AReal(std::numeric_limits<double>::infinity()).toString(), "Inf");
	BOOST_CHECK_EQUAL(AReal(std::string("12.75")).toString(), "12.75");
	BOOST_CHECK_THROW(AReal(std::string("1.2.3")), ArithError);
}

BOOST_AUTO_TEST_CASE(TestDefaults)
{
	DefaultsGuard guard;

	AReal::setDefaultPrecision(128);
	BOOST_CHECK_EQUAL(AReal(1.0).precision(), 128u);
	BOOST_CHECK_EQUAL(AReal(1.0, 64).precision(), 64u);
	BOOST_CHECK_THROW(AReal::setDefaultPrecision(0), DomainError);

	AReal::setDefaultRounding(AReal::Rounding::towardZero);
	BOOST_CHECK(AReal(1.0).rounding() == AReal::Rounding::towardZero);
}

BOOST_AUTO_TEST_CASE(TestBinaryOpPrecision)
{
	AReal narrow(1.0, 32), wide(3.0, 200);
	BOOST_CHECK_EQUAL((narrow + wide).precision(), 200u);
	BOOST_CHECK_EQUAL((narrow / wide).precision(), 200u);
	BOOST_CHECK(narrow < wide);
	BOOST_CHECK((-narrow).sign() < 0);
}

BOOST_AUTO_TEST_CASE(TestInplaceBuiltin)
{
	double a = 10.0;
	BOOST_CHECK_EQUAL(inplace::zero(a), 0.0);
	BOOST_CHECK_EQUAL(inplace::mul(a, 2.0, 3.0), 6.0);
	BOOST_CHECK_EQUAL(inplace::add(a, 2.0, 3.0), 5.0);
	BOOST_CHECK_EQUAL(inplace::addeq(a, 3.0), 13.0);
	BOOST_CHECK_EQUAL(inplace::addmul(a, 2.0, 3.0, 0.0), 16.0);
	BOOST_CHECK_EQUAL(inplace::addmul(a, 2.0, 3.0), 16.0);
	BOOST_CHECK_EQUAL(a, 10.0);
}

BOOST_AUTO_TEST_CASE(TestInplaceReal)
{
	AReal a(10.0, 64);

	auto &zeroed = inplace::zero(a);
	BOOST_CHECK(&zeroed == &a);
	BOOST_CHECK(a.isZero());
	BOOST_CHECK_EQUAL(a.precision(), 64u);

	inplace::mul(a, AReal(2.0), AReal(3.0));
	BOOST_CHECK(a == AReal(6.0));
	BOOST_CHECK_EQUAL(a.precision(), 64u);

	inplace::add(a, a, AReal(1.0));
	BOOST_CHECK(a == AReal(7.0));

	inplace::addeq(a, a);
	BOOST_CHECK(a == AReal(14.0));

	AReal scratch(0.0);
	inplace::addmul(a, AReal(2.0), AReal(3.0), scratch);
	BOOST_CHECK(a == AReal(20.0));
	BOOST_CHECK(scratch.isZero());

	inplace::addmul(a, a, AReal(0.5));
	BOOST_CHECK(a == AReal(30.0));
	BOOST_CHECK_EQUAL(a.precision(), 64u);
}

BOOST_AUTO_TEST_CASE(TestInplaceInheritsRounding)
{
	DefaultsGuard guard;

	AReal::setDefaultRounding(AReal::Rounding::up);
	AReal up(0.0, 8);
	AReal::setDefaultRounding(AReal::Rounding::down);
	AReal down(0.0, 8);
	AReal::setDefaultRounding(AReal::Rounding::nearest);

	AReal one(1.0), tiny(std::ldexp(1.0, -20));

	up.assignAdd(one, tiny);
	down.assignAdd(one, tiny);

	BOOST_CHECK(up.rounding() == AReal::Rounding::up);
	BOOST_CHECK_EQUAL(up.precision(), 8u);
	BOOST_CHECK(up == AReal(1.0078125));
	BOOST_CHECK(down == AReal(1.0));

	AReal upFma(1.0, 8);
	upFma = up;
	upFma.setZero();
	inplace::addmul(upFma, one, one);
	inplace::addmul(upFma, tiny, one);
	BOOST_CHECK(upFma == AReal(1.0078125));
}

BOOST_AUTO_TEST_CASE(TestRandomSampling)
{
	RandState rng(99);

	for(int i = 0; i < 200; i++){
		auto x = RDF::instance().random(rng, -2.0, 3.0);
		BOOST_REQUIRE(x >= -2.0 && x < 3.0);

		auto y = RR::instance().random(rng, 1.0, 1.5);
		BOOST_REQUIRE(y >= AReal(1.0) && y <= AReal(1.5));
	}

	BOOST_CHECK_EQUAL(RDF::instance().random(rng, 4.0, 4.0), 4.0);
	BOOST_CHECK_THROW(RDF::instance().random(rng, 1.0, 0.0), DomainError);
}
