// cpp/src/session.cpp
#include "redline/session.h"
#include "redline/errors.h"

#include <exception>

#include <spdlog/spdlog.h>

namespace redline {

namespace {

void close_dom(const std::shared_ptr<DomHandle>& dom) {
    try {
        dom->close();
    } catch (const std::exception& e) {
        // already closed is an expected state
        spdlog::debug("session: dom close ignored: {}", e.what());
    }
}

} // namespace

std::unique_ptr<DocumentSession> DocumentSession::create(EditorFactory& factory,
                                                         TaskQueue& deferred,
                                                         const std::string& buffer) {
    std::unique_ptr<DocumentSession> s(new DocumentSession(deferred));

    try {
        factory.create(buffer, s->parts_);
    } catch (const std::exception& e) {
        spdlog::info("session: editor construction failed: {}", e.what());
        s->cleanup();
        throw RedlineException(ErrorCode::SessionFailed, "Unable to load document");
    }

    if (!s->parts_.editor) {
        s->cleanup();
        throw RedlineException(ErrorCode::SessionFailed, "Unable to load document");
    }
    return s;
}

DocumentSession::~DocumentSession() {
    cleanup();
}

EditorHandle& DocumentSession::editor() {
    if (cleaned_.load() || !parts_.editor) {
        throw RedlineException(ErrorCode::Internal, "document session already cleaned up");
    }
    return *parts_.editor;
}

void DocumentSession::cleanup() noexcept {
    if (cleaned_.exchange(true)) return;

    if (parts_.editor) {
        try {
            parts_.editor->destroy();
        } catch (const std::exception& e) {
            spdlog::debug("session: editor destroy ignored: {}", e.what());
        }
        parts_.editor.reset();
    }

    std::shared_ptr<DomHandle> dom = std::move(parts_.dom);
    if (!dom) return;

    try {
        deferred_.post([dom] { close_dom(dom); });
    } catch (const std::exception& e) {
        spdlog::warn("session: cannot defer dom close, closing inline: {}", e.what());
        close_dom(dom);
    }
}

} // namespace redline
