#ifndef KOMBINE_VERSION_H_
#define KOMBINE_VERSION_H_

#include <string>

namespace kombine {

extern const std::string k_kombine_version_string;
extern const int k_kombine_build_number;
extern const std::string k_kombine_commit_string;

}  // namespace kombine

#endif // KOMBINE_VERSION_H_
