#include "contract.hpp"
#include <algorithm>

namespace tsm {

bool ShapeContract::conforms(const Tensor& tensor, const Shape& expected) {
    const Shape& actual = tensor.shape();
    if (actual.size() < expected.size()) {
        return false;
    }
    return std::equal(expected.begin(), expected.end(), actual.end() - expected.size());
}

void ShapeContract::validate(const Tensor& tensor, const Shape& expected, const std::string& what) {
    if (!conforms(tensor, expected)) {
        throw ShapeError("Wrong shape for " + what + ": got " + shape_to_string(tensor.shape()) +
                         ", trailing dimensions must be " + shape_to_string(expected));
    }
}

void ShapeContract::check_declared(const Shape& shape, const std::string& what) {
    if (shape.empty()) {
        throw InvalidArgumentError(what + " must have at least one dimension");
    }
    for (size_t extent : shape) {
        if (extent == 0) {
            throw InvalidArgumentError(what + " " + shape_to_string(shape) +
                                       " must only contain positive extents");
        }
    }
}

void require_known_fields(const Record& record, std::initializer_list<const char*> known,
                          const std::string& what) {
    for (const auto& child : record) {
        const std::string& name = child.first;
        bool found = std::any_of(known.begin(), known.end(),
                                 [&](const char* k) { return name == k; });
        if (!found) {
            throw InvalidArgumentError("Unknown field '" + name + "' in " + what);
        }
    }
}

} // namespace tsm
