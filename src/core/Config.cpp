#include "fedlink/Config.hpp"

#include <utility>

namespace fedlink {

CredentialSource CredentialSource::from_file(std::filesystem::path file) {
    CredentialSource source{};
    source.path = std::move(file);
    return source;
}

CredentialSource CredentialSource::from_pem(std::string bytes) {
    CredentialSource source{};
    source.pem = std::move(bytes);
    return source;
}

std::string CredentialSource::describe() const {
    if (pem.has_value()) {
        return "<inline pem>";
    }
    if (path.has_value()) {
        return path->string();
    }
    return "<unset>";
}

}  // namespace fedlink
