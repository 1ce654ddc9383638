#ifndef ARITH_EXPR_HPP
#define ARITH_EXPR_HPP 1

#include <memory>
#include <string>

#include "fwd.hpp"

//! \file

namespace arith{
	//! Structured form of a value, consumed by an external formatter
	struct Expr{
		virtual ~Expr() = default;
		virtual std::string toString() const = 0;
	};

	namespace Exprs{
		//! Plain value token
		struct Token: Expr{
			explicit Token(std::string value_): value(std::move(value_)){}

			std::string toString() const override{ return value; }

			std::string value;
		};

		//! Prefix operation, e.g. negation
		struct UnaryOp: Expr{
			UnaryOp(std::string op_, ExprPtr operand_)
				: op(std::move(op_)), operand(std::move(operand_)){}

			std::string toString() const override{ return op + operand->toString(); }

			std::string op;
			ExprPtr operand;
		};

		//! Binary operation expression
		struct BinOp: Expr{
			BinOp(std::string op_, ExprPtr lhs_, ExprPtr rhs_)
				: lhs(std::move(lhs_)), rhs(std::move(rhs_)), op(std::move(op_)){}

			std::string toString() const override{
				return lhs->toString() + op + rhs->toString();
			}

			ExprPtr lhs, rhs;
			std::string op;
		};
	}
}

#endif // !ARITH_EXPR_HPP
