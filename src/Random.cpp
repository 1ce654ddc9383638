#include <cmath>

#include "arith/Error.hpp"

#include "Impls.hpp"

using namespace arith;

RandState::RandState() noexcept: m_impl(std::make_unique<Impl>()){
	gmp_randinit_default(m_impl->state);
}

RandState::RandState(std::uint64_t seed) noexcept: RandState(){
	AInt seedValue(seed);
	gmp_randseed(m_impl->state, seedValue.m_impl->value);
}

RandState::RandState(RandState &&other) noexcept: m_impl(std::move(other.m_impl)){}

RandState::~RandState(){}

RandState &RandState::operator=(RandState &&other) noexcept{
	m_impl.swap(other.m_impl);
	return *this;
}

AInt RandState::uniform(const AInt &lo, const AInt &hi){
	if(lo > hi)
		throw DomainError("empty range [" + lo.toString() + ", " + hi.toString() + "]");

	auto width = hi - lo + AInt(1);

	AInt res;
	mpz_init(res.m_impl->value);
	mpz_urandomm(res.m_impl->value, m_impl->state, width.m_impl->value);
	mpz_add(res.m_impl->value, res.m_impl->value, lo.m_impl->value);
	return res;
}

std::int64_t RandState::uniform(std::int64_t lo, std::int64_t hi){
	return uniform(AInt(lo), AInt(hi)).toInt64();
}

double RandState::unit(){
	AInt bits(0);
	mpz_urandomb(bits.m_impl->value, m_impl->state, 53);
	return std::ldexp(bits.toDouble(), -53);
}

AReal RandState::unitReal(std::size_t precision){
	AReal res(0.0, precision);
	mpfr_urandomb(res.m_impl->value, m_impl->state);
	return res;
}
