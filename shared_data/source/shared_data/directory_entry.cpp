#include <shared_data/directory_entry.hpp>

#include <utility/algorithm/case_convert.hpp>

namespace SharedData
{
    bool listingOrder(DirectoryEntry const& lhs, DirectoryEntry const& rhs)
    {
        if (lhs.isDirectory() != rhs.isDirectory())
            return lhs.isDirectory();
        return Utility::Algorithm::lessCaseInsensitive(lhs.name, rhs.name);
    }
}
