#pragma once

#include <sstream>
#include <string>

namespace plonkish {

// Field elements only need operator<< to appear in reports and exports
template<typename F>
std::string format_field(const F& value) {
    std::ostringstream os;
    os << value;
    return os.str();
}

} // namespace plonkish
