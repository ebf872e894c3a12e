#include "services/transfer/store_association.hpp"

#include "core/logging.hpp"

#include <algorithm>
#include <cstring>
#include <format>
#include <iterator>
#include <memory>
#include <mutex>

// DCMTK headers
#include <dcmtk/config/osconfig.h>
#include <dcmtk/dcmdata/dcdeftag.h>
#include <dcmtk/dcmdata/dcfilefo.h>
#include <dcmtk/dcmdata/dcuid.h>
#include <dcmtk/dcmdata/dcxfer.h>
#include <dcmtk/dcmnet/assoc.h>
#include <dcmtk/dcmnet/dimse.h>
#include <dcmtk/dcmnet/diutil.h>
#include <dcmtk/dcmnet/dul.h>

namespace dicom_transfer::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("StoreAssociation");
    return logger;
}

// Presentation context IDs are odd numbers in [1, 255]
constexpr int kMaxPresentationContexts = 128;

/**
 * @brief Association owning its DCMTK network and association handles
 */
class DcmtkStoreAssociation : public IStoreAssociation {
public:
    DcmtkStoreAssociation(T_ASC_Network* network, T_ASC_Association* assoc)
        : network_(network), assoc_(assoc) {
    }

    ~DcmtkStoreAssociation() override {
        if (state_ == AssociationState::Open) {
            abort();
        }
        if (assoc_) {
            ASC_destroyAssociation(&assoc_);
        }
        if (network_) {
            ASC_dropNetwork(&network_);
        }
    }

    DcmtkStoreAssociation(const DcmtkStoreAssociation&) = delete;
    DcmtkStoreAssociation& operator=(const DcmtkStoreAssociation&) = delete;

    std::expected<StoreResponse, StoreFailureInfo>
    store(const std::filesystem::path& file, std::chrono::seconds timeout) override {
        if (state_ != AssociationState::Open) {
            return std::unexpected(StoreFailureInfo{
                StoreFailure::NetworkError,
                std::format("association is {}", toString(state_))
            });
        }

        DcmFileFormat fileFormat;
        OFCondition cond = fileFormat.loadFile(file.string().c_str());
        if (cond.bad()) {
            return std::unexpected(StoreFailureInfo{
                StoreFailure::InvalidObject,
                std::string("cannot read staged file: ") + cond.text()
            });
        }

        DcmDataset* dataset = fileFormat.getDataset();

        char sopClass[128] = {0};
        char sopInstance[128] = {0};
        if (!DU_findSOPClassAndInstanceInDataSet(dataset, sopClass, sizeof(sopClass),
                                                 sopInstance, sizeof(sopInstance))) {
            return std::unexpected(StoreFailureInfo{
                StoreFailure::InvalidObject,
                "SOP Class or SOP Instance UID missing"
            });
        }

        T_ASC_PresentationContextID presId =
            ASC_findAcceptedPresentationContextID(assoc_, sopClass);
        if (presId == 0) {
            return std::unexpected(StoreFailureInfo{
                StoreFailure::NoPresentationContext,
                std::string("no accepted presentation context for ") +
                    dcmFindNameOfUID(sopClass, sopClass)
            });
        }

        T_ASC_PresentationContext pc;
        ASC_findAcceptedPresentationContext(assoc_->params, presId, &pc);
        DcmXfer networkXfer(pc.acceptedTransferSyntax);
        if (dataset->getOriginalXfer() != networkXfer.getXfer()) {
            cond = dataset->chooseRepresentation(networkXfer.getXfer(), nullptr);
            if (cond.bad() || !dataset->canWriteXfer(networkXfer.getXfer())) {
                return std::unexpected(StoreFailureInfo{
                    StoreFailure::InvalidObject,
                    std::string("cannot encode object as ") + networkXfer.getXferName()
                });
            }
        }

        T_DIMSE_C_StoreRQ request;
        std::memset(&request, 0, sizeof(request));
        request.MessageID = assoc_->nextMsgID++;
        OFStandard::strlcpy(request.AffectedSOPClassUID, sopClass,
                            sizeof(request.AffectedSOPClassUID));
        OFStandard::strlcpy(request.AffectedSOPInstanceUID, sopInstance,
                            sizeof(request.AffectedSOPInstanceUID));
        request.DataSetType = DIMSE_DATASET_PRESENT;
        request.Priority = DIMSE_PRIORITY_MEDIUM;

        T_DIMSE_C_StoreRSP response;
        std::memset(&response, 0, sizeof(response));
        DcmDataset* statusDetail = nullptr;

        getLogger()->debug("Sending C-STORE {} (Message ID: {})", sopInstance, request.MessageID);

        cond = DIMSE_storeUser(
            assoc_,
            presId,
            &request,
            nullptr,
            dataset,
            nullptr,
            nullptr,
            DIMSE_NONBLOCKING,
            static_cast<int>(timeout.count()),
            &response,
            &statusDetail
        );
        std::unique_ptr<DcmDataset> detail(statusDetail);

        if (cond.bad()) {
            // A late response would desynchronize the next request
            abort();
            if (cond == DIMSE_NODATAAVAILABLE) {
                return std::unexpected(StoreFailureInfo{StoreFailure::Timeout, "timeout"});
            }
            return std::unexpected(StoreFailureInfo{
                StoreFailure::NetworkError,
                std::string("C-STORE failed: ") + cond.text()
            });
        }

        StoreResponse result;
        result.status = response.DimseStatus;
        if (detail) {
            OFString comment;
            if (detail->findAndGetOFString(DCM_ErrorComment, comment).good()) {
                result.errorComment = comment.c_str();
            }
        }
        return result;
    }

    void release() override {
        if (state_ != AssociationState::Open) {
            return;
        }

        state_ = AssociationState::Closing;
        OFCondition cond = ASC_releaseAssociation(assoc_);
        if (cond.bad()) {
            getLogger()->warn("Release failed ({}), aborting association", cond.text());
            ASC_abortAssociation(assoc_);
        }
        state_ = AssociationState::Closed;
    }

    void abort() override {
        if (state_ != AssociationState::Open && state_ != AssociationState::Closing) {
            return;
        }

        OFCondition cond = ASC_abortAssociation(assoc_);
        if (cond.bad()) {
            getLogger()->debug("Abort failed: {}", cond.text());
        }
        state_ = AssociationState::Failed;
    }

    AssociationState state() const noexcept override {
        return state_;
    }

private:
    T_ASC_Network* network_ = nullptr;
    T_ASC_Association* assoc_ = nullptr;
    AssociationState state_ = AssociationState::Open;
};

std::mutex& connectMutex() {
    static std::mutex mutex;
    return mutex;
}

} // anonymous namespace

std::string_view toString(AssociationState state) noexcept {
    switch (state) {
        case AssociationState::Idle:        return "Idle";
        case AssociationState::Negotiating: return "Negotiating";
        case AssociationState::Open:        return "Open";
        case AssociationState::Closing:     return "Closing";
        case AssociationState::Closed:      return "Closed";
        case AssociationState::Failed:      return "Failed";
    }
    return "Unknown";
}

std::expected<std::unique_ptr<IStoreAssociation>, PacsErrorInfo>
DcmtkStoreAssociationFactory::associate(const PacsServerConfig& config) {
    if (!config.isValid()) {
        return std::unexpected(PacsErrorInfo{
            PacsError::ConfigurationInvalid,
            "Invalid PACS server configuration"
        });
    }

    const auto timeoutSeconds = static_cast<int>(config.connectionTimeout.count());

    T_ASC_Network* network = nullptr;
    OFCondition cond = ASC_initializeNetwork(NET_REQUESTOR, 0, timeoutSeconds, &network);
    if (cond.bad()) {
        getLogger()->error("Failed to initialize network: {}", cond.text());
        return std::unexpected(PacsErrorInfo{
            PacsError::NetworkError,
            std::string("Failed to initialize network: ") + cond.text()
        });
    }

    T_ASC_Parameters* params = nullptr;
    cond = ASC_createAssociationParameters(&params, config.maxPduSize);
    if (cond.bad()) {
        ASC_dropNetwork(&network);
        return std::unexpected(PacsErrorInfo{
            PacsError::InternalError,
            std::string("Failed to create association parameters: ") + cond.text()
        });
    }

    ASC_setAPTitles(params,
                    config.callingAeTitle.c_str(),
                    config.calledAeTitle.c_str(),
                    nullptr);

    std::string peerAddress = config.hostname + ":" + std::to_string(config.port);
    ASC_setPresentationAddresses(params,
                                 OFStandard::getHostName().c_str(),
                                 peerAddress.c_str());

    const char* transferSyntaxes[] = {
        UID_LittleEndianExplicitTransferSyntax,
        UID_BigEndianExplicitTransferSyntax,
        UID_LittleEndianImplicitTransferSyntax
    };

    const int contextCount = std::min(numberOfDcmLongSCUStorageSOPClassUIDs,
                                      kMaxPresentationContexts);
    for (int i = 0; i < contextCount; ++i) {
        cond = ASC_addPresentationContext(
            params,
            static_cast<T_ASC_PresentationContextID>(2 * i + 1),
            dcmLongSCUStorageSOPClassUIDs[i],
            transferSyntaxes,
            static_cast<int>(std::size(transferSyntaxes))
        );
        if (cond.bad()) {
            ASC_destroyAssociationParameters(&params);
            ASC_dropNetwork(&network);
            return std::unexpected(PacsErrorInfo{
                PacsError::InternalError,
                std::string("Failed to add presentation context: ") + cond.text()
            });
        }
    }

    getLogger()->info("Requesting C-STORE association with {} (AE: {}, {} contexts)",
                      peerAddress, config.calledAeTitle, contextCount);

    T_ASC_Association* assoc = nullptr;
    {
        // dcmConnectionTimeout is process-wide and read during the connect,
        // so concurrent requests with different timeouts take turns
        std::lock_guard<std::mutex> lock(connectMutex());
        dcmConnectionTimeout.set(static_cast<Sint32>(timeoutSeconds));
        cond = ASC_requestAssociation(network, params, &assoc);
    }
    if (cond.bad()) {
        // Once allocated, the association owns the parameters
        if (assoc) {
            ASC_destroyAssociation(&assoc);
        } else {
            ASC_destroyAssociationParameters(&params);
        }
        ASC_dropNetwork(&network);

        if (cond == DUL_ASSOCIATIONREJECTED) {
            getLogger()->error("Association rejected: {}", cond.text());
            return std::unexpected(PacsErrorInfo{
                PacsError::AssociationRejected,
                std::string("Association rejected: ") + cond.text()
            });
        }

        getLogger()->error("Failed to request association: {}", cond.text());
        return std::unexpected(PacsErrorInfo{
            PacsError::ConnectionFailed,
            std::string("Failed to request association: ") + cond.text()
        });
    }

    if (ASC_countAcceptedPresentationContexts(assoc->params) == 0) {
        ASC_abortAssociation(assoc);
        ASC_destroyAssociation(&assoc);
        ASC_dropNetwork(&network);
        getLogger()->error("No storage presentation context was accepted");
        return std::unexpected(PacsErrorInfo{
            PacsError::AssociationRejected,
            "No storage presentation context was accepted by the server"
        });
    }

    getLogger()->debug("Association accepted with {} presentation contexts",
                       ASC_countAcceptedPresentationContexts(assoc->params));

    return std::make_unique<DcmtkStoreAssociation>(network, assoc);
}

} // namespace dicom_transfer::services
