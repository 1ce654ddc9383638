#ifndef ARITH_ERROR_HPP
#define ARITH_ERROR_HPP 1

#include <exception>
#include <string>
#include <utility>

namespace arith{
	//! Base of every error raised by the arithmetic layer
	class ArithError: public std::exception{
		public:
			explicit ArithError(std::string msg): m_msg(std::move(msg)){}

			const char *what() const noexcept override{ return m_msg.c_str(); }

		private:
			std::string m_msg;
	};

	//! Zero denominator on construction or zero divisor on exact division
	class DivisionByZero: public ArithError{
		public:
			explicit DivisionByZero(std::string msg = "division by zero"): ArithError(std::move(msg)){}
	};

	//! Checked square root of a value that is not a perfect square
	class NotSquare: public ArithError{
		public:
			explicit NotSquare(std::string msg = "not a square"): ArithError(std::move(msg)){}
	};

	//! Argument outside the domain an operation is defined on
	class DomainError: public ArithError{
		public:
			explicit DomainError(std::string msg): ArithError(std::move(msg)){}
	};

	//! Fixed-width integer arithmetic left its representable range
	class OverflowError: public ArithError{
		public:
			explicit OverflowError(std::string msg = "integer overflow"): ArithError(std::move(msg)){}
	};

	//! Report a broken internal invariant and throw ArithError
	[[noreturn]] void internalError(const std::string &msg);
}

#endif // !ARITH_ERROR_HPP
