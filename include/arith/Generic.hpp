#ifndef ARITH_GENERIC_HPP
#define ARITH_GENERIC_HPP 1

#include <string>
#include <vector>

#include "Float.hpp"
#include "RationalField.hpp"

//! \file
//! Algorithms written once against a field descriptor \p F and its element type

namespace arith{
	/**
	 * Value of the polynomial with coefficients \p coeffs (constant term first) at \p x,
	 * by Horner's rule on a single accumulator.
	 **/
	template<typename F>
	typename F::Elem evaluate(const F &R, const std::vector<typename F::Elem> &coeffs, const typename F::Elem &x){
		auto acc = R.zero();
		for(auto it = coeffs.rbegin(); it != coeffs.rend(); ++it){
			acc = inplace::mul(acc, acc, x);
			acc = inplace::addeq(acc, *it);
		}

		return acc;
	}

	template<typename F>
	typename F::Elem dot(const F &R, const std::vector<typename F::Elem> &a, const std::vector<typename F::Elem> &b){
		if(a.size() != b.size())
			throw DomainError(
				"dot product of sequences of length " + std::to_string(a.size()) + " and " + std::to_string(b.size())
			);

		auto acc = R.zero();
		auto tmp = R.zero();
		for(std::size_t i = 0; i < a.size(); i++)
			acc = inplace::addmul(acc, a[i], b[i], tmp);

		return acc;
	}

	template<typename F>
	typename F::Elem sum(const F &R, const std::vector<typename F::Elem> &xs){
		auto acc = R.zero();
		for(auto &&x : xs)
			acc = inplace::addeq(acc, x);

		return acc;
	}

	//! Zero for an empty or all-zero sequence, a unit otherwise
	template<typename F>
	typename F::Elem gcdOf(const F &R, const std::vector<typename F::Elem> &xs){
		auto g = R.zero();
		for(auto &&x : xs)
			g = gcd(g, x);

		return g;
	}
}

#endif // !ARITH_GENERIC_HPP
