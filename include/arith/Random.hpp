#ifndef ARITH_RANDOM_HPP
#define ARITH_RANDOM_HPP 1

#include <cstdint>
#include <memory>

#include "AInt.hpp"
#include "AReal.hpp"

namespace arith{
	//! Source of uniform random values, backed by a GMP random state
	class RandState{
		public:
			RandState() noexcept;
			explicit RandState(std::uint64_t seed) noexcept;

			RandState(const RandState&) = delete;
			RandState(RandState &&other) noexcept;

			~RandState();

			RandState &operator=(const RandState&) = delete;
			RandState &operator=(RandState &&other) noexcept;

			//! Uniform integer in [lo, hi], throws DomainError if lo > hi
			AInt uniform(const AInt &lo, const AInt &hi);
			std::int64_t uniform(std::int64_t lo, std::int64_t hi);

			//! Uniform double in [0, 1)
			double unit();

			//! Uniform real in [0, 1) with \p precision bits
			AReal unitReal(std::size_t precision = AReal::defaultPrecision());

		private:
			struct Impl;
			std::unique_ptr<Impl> m_impl;
	};
}

#endif // !ARITH_RANDOM_HPP
