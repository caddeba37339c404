#ifndef MEDIAFORGE_UUID_HPP
#define MEDIAFORGE_UUID_HPP

#include <string>

/// Random (version 4) UUID in canonical textual form.
[[nodiscard]] std::string generate_uuid();

#endif //MEDIAFORGE_UUID_HPP
