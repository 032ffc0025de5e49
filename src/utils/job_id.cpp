#include "utils/job_id.h"

#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

namespace mhub {

std::string generate_job_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t v = rng();
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << v;
    return oss.str();
}

std::string generate_container_name(const std::string& model_id, const std::string& job_id) {
    std::string model;
    for (char c : model_id) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '_' || c == '-' || c == '.') {
            model.push_back(static_cast<char>(std::tolower(uc)));
        } else {
            model.push_back('-');
        }
    }
    if (model.empty()) model = "job";
    return "mhub-" + model + "-" + job_id.substr(0, 8);
}

}  // namespace mhub
