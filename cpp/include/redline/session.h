// cpp/include/redline/session.h
#pragma once
#include <atomic>
#include <memory>
#include <string>

#include "redline/engine.h"
#include "redline/task_queue.h"

namespace redline {

// One editing-engine instance for the span of a single request.
//
// cleanup() is idempotent and never throws. It destroys the editor inline and
// posts the DOM close to the deferred queue, so the object graph is torn down
// only after the current call stack has unwound.
class DocumentSession {
public:
    // throws RedlineException(SessionFailed); partial handles are cleaned first
    static std::unique_ptr<DocumentSession> create(EditorFactory& factory,
                                                   TaskQueue& deferred,
                                                   const std::string& buffer);

    ~DocumentSession();

    DocumentSession(const DocumentSession&) = delete;
    DocumentSession& operator=(const DocumentSession&) = delete;

    // throws RedlineException(Internal) after cleanup
    EditorHandle& editor();

    void cleanup() noexcept;
    bool cleaned_up() const { return cleaned_.load(); }

private:
    explicit DocumentSession(TaskQueue& deferred) : deferred_(deferred) {}

    TaskQueue& deferred_;
    EditorParts parts_;
    std::atomic<bool> cleaned_{false};
};

} // namespace redline
