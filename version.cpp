#include "version.h"

namespace kombine {

const std::string k_kombine_version_string = KOMBINE_VERSION_STRING;
const int k_kombine_build_number = KOMBINE_BUILD_NUMBER;
const std::string k_kombine_commit_string = KOMBINE_COMMIT_STRING;

}  // namespace kombine
