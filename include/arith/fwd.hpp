#ifndef ARITH_FWD_HPP
#define ARITH_FWD_HPP 1

#include <memory>

namespace arith{
	class AInt;
	class AReal;
	class RandState;

	struct Ring;
	struct Field;
	struct Expr;

	template<typename I> class Rational;
	template<typename I> struct IntegerOps;
	template<typename I> class IntegerRing;
	template<typename I> class RationalField;
	template<typename T> class FloatField;

	using ExprPtr = std::unique_ptr<Expr>;
}

#endif // !ARITH_FWD_HPP
