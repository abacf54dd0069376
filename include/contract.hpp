#ifndef TSM_CONTRACT_HPP
#define TSM_CONTRACT_HPP

#include "errors.hpp"
#include "tensor.hpp"
#include <initializer_list>
#include <string>
#include <utility>

#include <boost/property_tree/ptree.hpp>

namespace tsm {

/**
 * Trailing-dimension shape checks.
 *
 * Only the last expected.size() dimensions are constrained; the leading
 * (batch/time) dimensions are free. A tensor with fewer dimensions than
 * expected never conforms.
 */
class ShapeContract {
public:
    static bool conforms(const Tensor& tensor, const Shape& expected);

    /**
     * @param what Checkpoint name used in the error message
     * @throws ShapeError
     */
    static void validate(const Tensor& tensor, const Shape& expected, const std::string& what);

    /**
     * Shapes declared at model construction: non-empty, positive extents.
     * @throws InvalidArgumentError
     */
    static void check_declared(const Shape& shape, const std::string& what);
};

/**
 * Interface for structured data objects that can check their own consistency.
 */
class DataModel {
public:
    virtual ~DataModel() = default;

    virtual bool check_integrity() const = 0;
};

/**
 * Construct a data object and reject it outright when it fails its own check.
 * @throws IntegrityError
 */
template <typename T, typename... Args>
T make_data_model(Args&&... args) {
    T object(std::forward<Args>(args)...);
    if (!object.check_integrity()) {
        throw IntegrityError(std::string("Data failed integrity check when initializing the ") +
                             T::type_name + " object.");
    }
    return object;
}

/**
 * Explicit field records (JSON objects) used to build data objects and
 * configurations.
 */
using Record = boost::property_tree::ptree;

/**
 * @throws InvalidArgumentError naming the first field outside `known`
 */
void require_known_fields(const Record& record, std::initializer_list<const char*> known,
                          const std::string& what);

} // namespace tsm

#endif // TSM_CONTRACT_HPP
