#include "storage/errors.hpp"

namespace cask::storage {

namespace {

class StorageCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "cask.storage"; }

    std::string message(int ev) const override {
        switch (static_cast<StorageErrc>(ev)) {
            case StorageErrc::corrupt_segment:
                return "corrupt segment";
            case StorageErrc::invalid_segment_name:
                return "invalid segment file name";
            case StorageErrc::empty_value:
                return "value must not be empty";
            case StorageErrc::engine_closed:
                return "engine is not open";
            case StorageErrc::merge_incomplete:
                return "interrupted merge could not be resolved";
        }
        return "unknown storage error";
    }
};

} // anonymous namespace

const std::error_category& storage_category() noexcept {
    static const StorageCategory category;
    return category;
}

std::error_code make_error_code(StorageErrc e) noexcept {
    return {static_cast<int>(e), storage_category()};
}

} // namespace cask::storage
