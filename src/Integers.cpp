#include <cmath>
#include <limits>

#include "arith/Error.hpp"
#include "arith/Integers.hpp"

using namespace arith;

using Int64Ops = IntegerOps<std::int64_t>;

std::int64_t Int64Ops::neg(std::int64_t x){
	if(x == std::numeric_limits<std::int64_t>::min())
		throw OverflowError("negation of " + std::to_string(x));

	return -x;
}

std::int64_t Int64Ops::add(std::int64_t a, std::int64_t b){
	std::int64_t res;
	if(__builtin_add_overflow(a, b, &res))
		throw OverflowError(std::to_string(a) + " + " + std::to_string(b));

	return res;
}

std::int64_t Int64Ops::sub(std::int64_t a, std::int64_t b){
	std::int64_t res;
	if(__builtin_sub_overflow(a, b, &res))
		throw OverflowError(std::to_string(a) + " - " + std::to_string(b));

	return res;
}

std::int64_t Int64Ops::mul(std::int64_t a, std::int64_t b){
	std::int64_t res;
	if(__builtin_mul_overflow(a, b, &res))
		throw OverflowError(std::to_string(a) + " * " + std::to_string(b));

	return res;
}

std::int64_t Int64Ops::gcd(std::int64_t a, std::int64_t b){
	auto magnitude = [](std::int64_t x){
		return x < 0 ? std::uint64_t(0) - static_cast<std::uint64_t>(x) : static_cast<std::uint64_t>(x);
	};

	auto u = magnitude(a), v = magnitude(b);
	while(v != 0){
		auto t = u % v;
		u = v;
		v = t;
	}

	if(u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
		throw OverflowError("gcd(" + std::to_string(a) + ", " + std::to_string(b) + ")");

	return static_cast<std::int64_t>(u);
}

std::int64_t Int64Ops::divexact(std::int64_t a, std::int64_t b){
	if(b == 0)
		throw DivisionByZero();

	if(b == -1)
		return neg(a);

	return a / b;
}

static std::int64_t isqrt(std::int64_t x) noexcept{
	auto r = static_cast<std::int64_t>(std::sqrt(static_cast<double>(x)));
	while(r > 0 && r > x / r)
		--r;
	while((r + 1) <= x / (r + 1))
		++r;
	return r;
}

bool Int64Ops::isSquare(std::int64_t x) noexcept{
	if(x < 0)
		return false;

	auto r = isqrt(x);
	return r * r == x;
}

std::int64_t Int64Ops::sqrt(std::int64_t x, bool check){
	if(check && !isSquare(x))
		throw NotSquare("not a square: " + std::to_string(x));

	if(x < 0)
		throw DomainError("square root of a negative integer");

	return isqrt(x);
}
