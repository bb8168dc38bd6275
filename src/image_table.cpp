// Copyright 2025 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

// identity
#include "crashdata/image_table.hpp"

// application
#include "crashdata/features.hpp"

#if CRASHDATA_FEATURE(DYLD)
#include <mach-o/dyld.h>
#endif // CRASHDATA_FEATURE(DYLD)

/**************************************************************************************************/

namespace crashdata {

/**************************************************************************************************/

namespace {

/**************************************************************************************************/

#if CRASHDATA_FEATURE(DYLD)

class dyld_image_table : public image_table {
public:
    std::uint32_t count() const override { return _dyld_image_count(); }

    // dyld returns null for an index past the end of the (possibly shrunken) table.
    std::optional<loaded_image> image(std::uint32_t index) const override {
        const struct mach_header* header = _dyld_get_image_header(index);
        const char* name = _dyld_get_image_name(index);

        if (header == nullptr || name == nullptr) return std::nullopt;

        loaded_image result;
        result._header = reinterpret_cast<const std::byte*>(header);
        result._slide = _dyld_get_image_vmaddr_slide(index);
        result._path = name;
        return result;
    }
};

using platform_image_table = dyld_image_table;

#else

class empty_image_table : public image_table {
public:
    std::uint32_t count() const override { return 0; }

    std::optional<loaded_image> image(std::uint32_t) const override { return std::nullopt; }
};

using platform_image_table = empty_image_table;

#endif // CRASHDATA_FEATURE(DYLD)

/**************************************************************************************************/

} // namespace

/**************************************************************************************************/

const image_table& live_image_table() {
    static const platform_image_table table{};
    return table;
}

/**************************************************************************************************/

} // namespace crashdata

/**************************************************************************************************/
