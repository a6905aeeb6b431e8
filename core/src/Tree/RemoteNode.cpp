#include "cloudannex/Tree/RemoteNode.h"
#include "cloudannex/Tree/PathResolver.h"
#include "cloudannex/Transfer/ChunkedDownload.h"
#include "cloudannex/Transfer/ChunkedUpload.h"
#include "cloudannex/Errors.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace CloudAnnex {

namespace {

/// Сбрасывает состояние передачи при любом выходе из receive()
class TransferStateGuard {
public:
    explicit TransferStateGuard(std::optional<TransferState>& state) : m_state(state) {}
    ~TransferStateGuard() { m_state.reset(); }

    TransferStateGuard(const TransferStateGuard&) = delete;
    TransferStateGuard& operator=(const TransferStateGuard&) = delete;

private:
    std::optional<TransferState>& m_state;
};

} // namespace

// ═══════════════════════════════════════════════════════════
// RemoteNode
// ═══════════════════════════════════════════════════════════

RemoteNode::RemoteNode(NodeKind kind, std::string name, std::optional<std::string> id,
                       std::weak_ptr<RemoteNode> parent)
    : m_name(std::move(name))
    , m_id(std::move(id))
    , m_kind(kind)
    , m_parent(std::move(parent)) {}

RemoteNode::~RemoteNode() = default;

std::shared_ptr<DriveApi> RemoteNode::session() const {
    if (m_contextBound) {
        return m_session;
    }
    for (auto node = m_parent.lock(); node; node = node->m_parent.lock()) {
        if (node->m_contextBound) {
            return node->m_session;
        }
    }
    throw UnsupportedOperationError("Node '" + m_name + "' is detached from its root");
}

std::shared_ptr<UploadJournal> RemoteNode::journal() const {
    if (m_contextBound) {
        return m_journal;
    }
    for (auto node = m_parent.lock(); node; node = node->m_parent.lock()) {
        if (node->m_contextBound) {
            return node->m_journal;
        }
    }
    throw UnsupportedOperationError("Node '" + m_name + "' is detached from its root");
}

void RemoteNode::bindContext(std::shared_ptr<DriveApi> session, std::shared_ptr<UploadJournal> journal) {
    if (!session) {
        throw std::invalid_argument("DriveApi session is required");
    }
    m_session = std::move(session);
    m_journal = std::move(journal);
    m_contextBound = true;
}

void RemoteNode::remove() {
    const std::string id = requireId();
    session()->deleteEntry(id);
    m_id.reset();
    spdlog::info("Removed {} '{}' ({})", nodeKindToString(m_kind), m_name, id);
}

std::shared_ptr<RemoteFolder> RemoteNode::asFolder() {
    if (!isFolder()) {
        throw TypeConflictError("'" + m_name + "' is a file, not a folder");
    }
    return std::static_pointer_cast<RemoteFolder>(shared_from_this());
}

std::shared_ptr<RemoteLeaf> RemoteNode::asLeaf() {
    if (!isLeaf()) {
        throw TypeConflictError("'" + m_name + "' is a folder, not a file");
    }
    return std::static_pointer_cast<RemoteLeaf>(shared_from_this());
}

const std::string& RemoteNode::requireId() const {
    if (!m_id) {
        throw UnsupportedOperationError("'" + m_name + "' has been removed");
    }
    return *m_id;
}

std::shared_ptr<RemoteNode> RemoteNode::makeChild(const RemoteEntry& entry) {
    std::shared_ptr<RemoteNode> node;
    if (entry.isFolder()) {
        node = std::make_shared<RemoteFolder>(entry.name, entry.id, weak_from_this());
    } else {
        node = std::make_shared<RemoteLeaf>(entry.name, entry.id, weak_from_this());
    }
    adopt(*node);
    return node;
}

void RemoteNode::adopt(RemoteNode& child) const {
    // Потомок не зависит от времени жизни предков
    child.bindContext(session(), journal());
}

// ═══════════════════════════════════════════════════════════
// RemoteFolder
// ═══════════════════════════════════════════════════════════

RemoteFolder::RemoteFolder(std::string name, std::optional<std::string> id,
                           std::weak_ptr<RemoteNode> parent)
    : RemoteNode(NodeKind::Folder, std::move(name), std::move(id), std::move(parent)) {}

std::shared_ptr<RemoteNode> RemoteFolder::child(const std::string& name) {
    const auto& parentId = requireId();
    auto lookup = session()->findChildren(parentId, name);

    if (lookup.isAmbiguous()) {
        throw AmbiguousNameError(parentId, name);
    }
    if (lookup.entries.empty()) {
        return nullptr;
    }
    return makeChild(lookup.entries.front());
}

std::shared_ptr<RemoteFolder> RemoteFolder::mkdir(const std::string& name) {
    if (auto existing = child(name)) {
        if (!existing->isFolder()) {
            throw TypeConflictError("Cannot create folder '" + name + "': a file with this name exists");
        }
        return existing->asFolder();
    }

    auto entry = session()->createFolder(requireId(), name);
    auto folder = std::make_shared<RemoteFolder>(name, entry.id, weak_from_this());
    adopt(*folder);
    return folder;
}

std::shared_ptr<RemoteLeaf> RemoteFolder::uploadLeaf(const std::string& name,
                                                     const std::string& localSource,
                                                     int64_t chunkSize,
                                                     const ProgressCallback& progress) {
    if (child(name)) {
        throw AlreadyExistsError(name);
    }

    UploadTarget target;
    target.parentId = requireId();
    target.name = name;

    ChunkedUpload upload(session(), journal());
    auto entry = upload.send(localSource, target, chunkSize, progress);
    auto leaf = std::make_shared<RemoteLeaf>(entry.name.empty() ? name : entry.name,
                                             entry.id, weak_from_this());
    adopt(*leaf);
    return leaf;
}

std::shared_ptr<RemoteNode> RemoteFolder::resolvePath(const std::string& path) {
    requireId();
    auto [first, rest] = PathResolver::splitFirst(path);
    if (first.empty()) {
        return shared_from_this();
    }

    auto node = child(first);
    if (!node || rest.empty()) {
        return node;
    }
    if (node->isLeaf()) {
        throw UnsupportedOperationError("Path '" + path + "' continues through file '" + first + "'");
    }

    return node->asFolder()->resolvePath(rest);
}

// ═══════════════════════════════════════════════════════════
// RemoteLeaf
// ═══════════════════════════════════════════════════════════

RemoteLeaf::RemoteLeaf(std::string name, std::optional<std::string> id,
                       std::weak_ptr<RemoteNode> parent)
    : RemoteNode(NodeKind::Leaf, std::move(name), std::move(id), std::move(parent)) {}

int64_t RemoteLeaf::receive(const std::string& localDestination,
                            int64_t chunkSize,
                            const ProgressCallback& progress) {
    const auto& id = requireId();
    auto drive = session();

    TransferStateGuard guard(m_transferState);
    TransferState state;
    state.direction = TransferDirection::Download;
    state.localPath = localDestination;
    state.totalSize = drive->getSize(id);
    m_transferState = state;

    ChunkedDownload download(drive);
    return download.receive(id, localDestination, chunkSize, [this, &progress](int64_t bytes) {
        m_transferState->bytesConfirmed = bytes;
        if (progress) {
            progress(bytes);
        }
    });
}

// ═══════════════════════════════════════════════════════════
// RemoteRoot
// ═══════════════════════════════════════════════════════════

RemoteRoot::RemoteRoot(const std::string& rootId)
    : RemoteFolder("", rootId, std::weak_ptr<RemoteNode>()) {}

std::shared_ptr<RemoteRoot> RemoteRoot::create(std::shared_ptr<DriveApi> session,
                                               std::shared_ptr<UploadJournal> journal,
                                               const std::string& rootId) {
    if (rootId.empty()) {
        throw std::invalid_argument("Root id is required");
    }
    std::shared_ptr<RemoteRoot> root(new RemoteRoot(rootId));
    root->bindContext(std::move(session), std::move(journal));
    return root;
}

void RemoteRoot::setRoot(const RemoteFolder& folder) {
    if (!folder.id()) {
        throw UnsupportedOperationError("Cannot use removed folder '" + folder.name() + "' as root");
    }
    m_id = folder.id();
    m_name = folder.name();
    spdlog::info("Root moved to '{}' ({})", m_name, *m_id);
}

void RemoteRoot::remove() {
    throw UnsupportedOperationError("The root folder cannot be removed");
}

} // namespace CloudAnnex
