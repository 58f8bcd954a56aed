#include "transfer_handler.hpp"

#include <optional>

#include "crypto.hpp"
#include "fuzzy.hpp"
#include "types.h"
#include "utils.hpp"

namespace {
void discard(const fs::path& temp_file) {
    std::error_code ec;
    fs::remove(temp_file, ec);
}
}  // namespace

void FileTransferHandler::handle(Notification::IncomingFileTransfer& offer) {
    EventBus& bus = m_state.events();

    json offer_data = {{"safe-filename", offer.safe_filename}, {"raw-filename", offer.raw_filename}};
    if (offer.size != 0) {
        offer_data["size"] = offer.size;
    }

    fs::path temp_file;
    std::optional<std::string> temp_error;
    try {
        temp_file = Utils::create_temp_file(offer.safe_filename);
    } catch (const std::exception& e) {
        temp_error = e.what();
    }

    bus.push(EventType::IncomingFileTransfer, offer_data);
    if (temp_error) {
        bus.push(EventType::TransferError, {{"safe-filename", offer.safe_filename}, {"error", *temp_error}});
        return;
    }

    if (Fuzzy::matches(offer.safe_filename, m_request) && !m_state.has_accepted_file()) {
        accept(offer, temp_file, offer_data);
    } else {
        discard(temp_file);
        bus.push(EventType::UnexpectedFileTransfer, offer_data);
    }
}

void FileTransferHandler::accept(Notification::IncomingFileTransfer& offer, const fs::path& temp_file,
                                 const json& offer_data) {
    EventBus& bus = m_state.events();
    try {
        if (!offer.accept) {
            throw std::runtime_error("offer cannot be accepted");
        }
        offer.accept(temp_file);
    } catch (const std::exception& e) {
        discard(temp_file);
        bus.push(EventType::TransferError, {{"safe-filename", offer.safe_filename}, {"error", e.what()}});
        return;
    }

    // Offers are delivered one at a time, but a second accepted file must
    // still never replace the first.
    if (!m_state.record_accepted_file(temp_file)) {
        discard(temp_file);
        bus.push(EventType::UnexpectedFileTransfer, offer_data);
        return;
    }

    json accepted = {{"file", temp_file.string()}};
    std::error_code ec;
    auto bytes = fs::file_size(temp_file, ec);
    if (!ec) {
        accepted["bytes"] = bytes;
    }
    try {
        accepted["sha256"] = Crypto::compute_file_hash(temp_file);
    } catch (const std::exception& e) {
        accepted["sha256-error"] = e.what();
    }
    bus.push(EventType::AcceptedFileTransfer, accepted);

    copy_resource(temp_file, offer.safe_filename);
}

void FileTransferHandler::copy_resource(const fs::path& temp_file, const std::string& safe_filename) {
    EventBus& bus = m_state.events();
    const fs::path destination = m_state.transfer_file_path() / safe_filename;
    try {
        fs::create_directories(m_state.transfer_file_path());
        fs::copy_file(temp_file, destination, fs::copy_options::overwrite_existing);
    } catch (const fs::filesystem_error& e) {
        bus.push(EventType::CopyError, {{"source", temp_file.string()}, {"destination", destination.string()},
                                        {"error", e.what()}});
        return;
    }
    bus.push(EventType::CopyResource, {{"source", temp_file.string()}, {"destination", destination.string()}});
}
