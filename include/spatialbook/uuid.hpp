#ifndef SPATIALBOOK_UUID_HPP
#define SPATIALBOOK_UUID_HPP

#include <string>
#include <string_view>

namespace spatialbook {

    // Random RFC 4122 version 4 identifier in canonical uppercase 8-4-4-4-12 form.
    std::string generate_uuid();
    bool        is_valid_uuid(std::string_view text);

} // namespace spatialbook

#endif // SPATIALBOOK_UUID_HPP
