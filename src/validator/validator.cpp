#include "validator/validator.hpp"

namespace executor {

validator::~validator() = default;

validator_loader::~validator_loader() = default;

}  // namespace executor
