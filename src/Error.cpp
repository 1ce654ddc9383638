#include <iostream>

#include "arith/Error.hpp"

using namespace arith;

void arith::internalError(const std::string &msg){
	std::cerr << "arith: internal error: " << msg << '\n';
	throw ArithError("internal error: " + msg);
}
