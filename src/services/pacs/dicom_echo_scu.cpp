#include "services/dicom_echo_scu.hpp"
#include "core/logging.hpp"

#include <atomic>
#include <chrono>
#include <format>

// pacs_system headers
#include <pacs/core/result.hpp>
#include <pacs/network/association.hpp>
#include <pacs/network/dimse/dimse_message.hpp>
#include <pacs/network/dimse/status_codes.hpp>

namespace dicom_transfer::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("EchoSCU");
    return logger;
}

using AssociationDuration = pacs::network::association::duration;
using pacs::network::association;

constexpr uint8_t VERIFICATION_CONTEXT_ID = 1;

std::unexpected<PacsErrorInfo> fail(PacsError code, std::string message) {
    getLogger()->error("{}", message);
    return std::unexpected(PacsErrorInfo{code, std::move(message)});
}

std::unexpected<PacsErrorInfo> cancelled() {
    getLogger()->info("Echo cancelled");
    return std::unexpected(PacsErrorInfo{PacsError::Cancelled, "Operation cancelled"});
}

AssociationDuration toAssociationDuration(std::chrono::seconds value) {
    return std::chrono::duration_cast<AssociationDuration>(value);
}

pacs::network::association_config verificationOnly(const PacsServerConfig& config) {
    pacs::network::proposed_presentation_context context;
    context.id = VERIFICATION_CONTEXT_ID;
    context.abstract_syntax = VERIFICATION_SOP_CLASS_UID;
    context.transfer_syntaxes = {
        "1.2.840.10008.1.2.1",  // Explicit VR Little Endian
        "1.2.840.10008.1.2"     // Implicit VR Little Endian
    };

    pacs::network::association_config assocConfig;
    assocConfig.calling_ae_title = config.callingAeTitle;
    assocConfig.called_ae_title = config.calledAeTitle;
    assocConfig.max_pdu_length = config.maxPduSize;
    assocConfig.proposed_contexts.push_back(std::move(context));
    return assocConfig;
}

std::unexpected<PacsErrorInfo> connectFailure(const pacs::error_info& err) {
    switch (err.code) {
        case pacs::error_codes::connection_timeout:
        case pacs::error_codes::receive_timeout:
            return fail(PacsError::Timeout, "Connection timeout: " + err.message);
        case pacs::error_codes::association_rejected:
            return fail(PacsError::AssociationRejected, "Association rejected: " + err.message);
        case pacs::error_codes::connection_failed:
            return fail(PacsError::ConnectionFailed, "Failed to connect: " + err.message);
        default:
            return fail(PacsError::ConnectionFailed, "Network error: " + err.message);
    }
}

} // anonymous namespace

class DicomEchoSCU::Impl {
public:
    std::expected<EchoResult, PacsErrorInfo> verify(const PacsServerConfig& config) {
        if (!config.isValid()) {
            return std::unexpected(PacsErrorInfo{
                PacsError::ConfigurationInvalid,
                "Invalid PACS server configuration"
            });
        }
        if (busy_.exchange(true)) {
            return std::unexpected(PacsErrorInfo{
                PacsError::InternalError,
                "A verification is already in progress"
            });
        }

        cancelled_.store(false);
        auto result = probe(config);
        busy_.store(false);
        return result;
    }

    void cancel() { cancelled_.store(true); }

    bool isVerifying() const { return busy_.load(); }

private:
    std::atomic<bool> busy_{false};
    std::atomic<bool> cancelled_{false};
    uint16_t messageId_{1};

    std::expected<EchoResult, PacsErrorInfo> probe(const PacsServerConfig& config) {
        const auto started = std::chrono::steady_clock::now();
        if (cancelled_.load()) {
            return cancelled();
        }

        getLogger()->info("Probing {}:{} (called AE: {}, calling AE: {})",
                          config.hostname, config.port,
                          config.calledAeTitle, config.callingAeTitle);

        auto connected = association::connect(config.hostname, config.port,
                                              verificationOnly(config),
                                              toAssociationDuration(config.connectionTimeout));
        if (!connected.is_ok()) {
            return connectFailure(connected.error());
        }
        auto assoc = std::move(connected.value());

        auto echoed = exchangeEcho(assoc, toAssociationDuration(config.dimseTimeout));
        if (!echoed) {
            return std::unexpected(echoed.error());
        }

        auto released = assoc.release(toAssociationDuration(config.dimseTimeout));
        if (!released.is_ok()) {
            getLogger()->warn("Association release failed: {}", released.error().message);
        }

        auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        getLogger()->info("{} answered C-ECHO in {}ms", config.calledAeTitle, latency.count());

        return EchoResult{
            .success = true,
            .latency = latency,
            .message = "Echo successful"
        };
    }

    /// Sends one C-ECHO; the association is aborted on any failure
    std::expected<void, PacsErrorInfo> exchangeEcho(association& assoc,
                                                    AssociationDuration timeout) {
        auto contextId = assoc.accepted_context_id(VERIFICATION_SOP_CLASS_UID);
        if (!contextId) {
            assoc.abort();
            return fail(PacsError::AssociationRejected,
                        "Verification SOP Class was not accepted by the server");
        }
        if (cancelled_.load()) {
            assoc.abort();
            return cancelled();
        }

        const uint16_t messageId = messageId_++;
        getLogger()->debug("C-ECHO-RQ message {}", messageId);

        auto sent = assoc.send_dimse(
            *contextId, pacs::network::dimse::make_c_echo_rq(messageId, VERIFICATION_SOP_CLASS_UID));
        if (!sent.is_ok()) {
            assoc.abort();
            return fail(PacsError::NetworkError,
                        "Failed to send C-ECHO request: " + sent.error().message);
        }

        auto received = assoc.receive_dimse(timeout);
        if (!received.is_ok()) {
            const auto& err = received.error();
            assoc.abort();
            if (err.code == pacs::error_codes::receive_timeout) {
                return fail(PacsError::Timeout, "C-ECHO timeout: " + err.message);
            }
            return fail(PacsError::NetworkError, "C-ECHO failed: " + err.message);
        }

        auto response = std::move(received).value().second;
        const auto status = static_cast<uint16_t>(response.status());
        if (status != static_cast<uint16_t>(pacs::network::dimse::status_success)) {
            (void)assoc.release(timeout);
            return fail(PacsError::NetworkError,
                        std::format("C-ECHO returned non-success status 0x{:04X}", status));
        }
        return {};
    }
};

// Public interface implementation

DicomEchoSCU::DicomEchoSCU()
    : impl_(std::make_unique<Impl>()) {
}

DicomEchoSCU::~DicomEchoSCU() = default;

DicomEchoSCU::DicomEchoSCU(DicomEchoSCU&&) noexcept = default;
DicomEchoSCU& DicomEchoSCU::operator=(DicomEchoSCU&&) noexcept = default;

std::expected<EchoResult, PacsErrorInfo> DicomEchoSCU::verify(const PacsServerConfig& config) {
    return impl_->verify(config);
}

void DicomEchoSCU::cancel() {
    impl_->cancel();
}

bool DicomEchoSCU::isVerifying() const {
    return impl_->isVerifying();
}

} // namespace dicom_transfer::services
