#include <bae/sample_format.hh>

namespace bae {

std::string short_input_message(std::size_t actual, std::size_t required) {
    return "ERROR: Given vector was length " + std::to_string(actual) +
           ". This function requires length " + std::to_string(required) + ".";
}

} // namespace bae
