#include "PairedRecordSynchronizer.hpp"

// Internal
#include "Utility.hpp"

namespace pipelines::tag {

namespace {
auto readName(std::string_view identifier) -> std::string_view {
    std::string_view name = helper::firstToken(identifier);
    if (name.size() >= 2 && name[name.size() - 2] == '/' &&
        (name.back() == '1' || name.back() == '2')) {
        name.remove_suffix(2);
    }
    return name;
}
}  // namespace

auto namesPair(std::string_view barcodeName, std::string_view alignedName) -> bool {
    return readName(barcodeName) == readName(alignedName);
}

}  // namespace pipelines::tag
