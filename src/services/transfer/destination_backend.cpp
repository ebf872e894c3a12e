#include "services/transfer/destination_backend.hpp"

#include "services/transfer/folder_backend.hpp"
#include "services/transfer/pacs_backend.hpp"

#include <algorithm>
#include <type_traits>

namespace dicom_transfer::services {

std::unique_ptr<IDestinationBackend>
makeDestinationBackend(const DestinationConfig& destination,
                       std::shared_ptr<IStoreAssociationFactory> associationFactory) {
    return std::visit([&](const auto& config) -> std::unique_ptr<IDestinationBackend> {
        using T = std::decay_t<decltype(config)>;
        if constexpr (std::is_same_v<T, FolderDestination>) {
            return std::make_unique<FolderBackend>(config);
        } else {
            return std::make_unique<PacsBackend>(config, std::move(associationFactory));
        }
    }, destination);
}

std::vector<const StagedObject*> inSequenceOrder(const std::vector<StagedObject>& objects) {
    std::vector<const StagedObject*> ordered;
    ordered.reserve(objects.size());
    for (const auto& object : objects) {
        ordered.push_back(&object);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
        [](const StagedObject* a, const StagedObject* b) {
            return a->sequenceIndex < b->sequenceIndex;
        });
    return ordered;
}

} // namespace dicom_transfer::services
