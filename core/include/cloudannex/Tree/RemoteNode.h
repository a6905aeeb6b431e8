// RemoteNode.h — узлы удалённого дерева: папки и файлы (листья)
//
// Родитель хранится как weak_ptr. Контекст (DriveApi-сессия и журнал загрузок)
// задаёт корень; узлы, созданные папкой, получают его копию при создании.

#pragma once

#include "../export.h"
#include "../Models.h"
#include "../Drive/DriveApi.h"
#include "../Transfer/UploadJournal.h"
#include <memory>
#include <optional>
#include <string>

namespace CloudAnnex {

class RemoteFolder;
class RemoteLeaf;

// ═══════════════════════════════════════════════════════════
// RemoteNode — общая часть папки и листа
// ═══════════════════════════════════════════════════════════

class CA_API RemoteNode : public std::enable_shared_from_this<RemoteNode> {
public:
    virtual ~RemoteNode();

    RemoteNode(const RemoteNode&) = delete;
    RemoteNode& operator=(const RemoteNode&) = delete;

    NodeKind kind() const { return m_kind; }
    bool isFolder() const { return m_kind == NodeKind::Folder; }
    bool isLeaf() const { return m_kind == NodeKind::Leaf; }

    const std::string& name() const { return m_name; }
    const std::optional<std::string>& id() const { return m_id; }

    /// Узел удалён через remove()
    bool isRemoved() const { return !m_id.has_value(); }

    std::shared_ptr<RemoteNode> parent() const { return m_parent.lock(); }

    /// Сессия хранилища: своя или ближайшего предка, у которого она задана
    /// @throws UnsupportedOperationError если цепочка предков оборвана
    std::shared_ptr<DriveApi> session() const;

    /// Журнал загрузок (может быть nullptr — сохранение выключено)
    std::shared_ptr<UploadJournal> journal() const;

    /// Задать контекст явно; узел становится точкой останова для поиска вверх
    void bindContext(std::shared_ptr<DriveApi> session, std::shared_ptr<UploadJournal> journal);
    bool hasBoundContext() const { return m_contextBound; }

    /// Удалить элемент в хранилище. После этого узел — надгробие.
    virtual void remove();

    /// @throws TypeConflictError если узел другого вида
    std::shared_ptr<RemoteFolder> asFolder();
    std::shared_ptr<RemoteLeaf> asLeaf();

protected:
    RemoteNode(NodeKind kind, std::string name, std::optional<std::string> id,
               std::weak_ptr<RemoteNode> parent);

    /// @throws UnsupportedOperationError для удалённого узла
    const std::string& requireId() const;

    /// Создать узел нужного вида для ответа хранилища; родитель — этот узел
    std::shared_ptr<RemoteNode> makeChild(const RemoteEntry& entry);

    /// Передать потомку свой контекст
    void adopt(RemoteNode& child) const;

    std::string m_name;
    std::optional<std::string> m_id;

private:
    NodeKind m_kind;
    std::weak_ptr<RemoteNode> m_parent;
    bool m_contextBound = false;
    std::shared_ptr<DriveApi> m_session;
    std::shared_ptr<UploadJournal> m_journal;
};

// ═══════════════════════════════════════════════════════════
// RemoteFolder
// ═══════════════════════════════════════════════════════════

class CA_API RemoteFolder : public RemoteNode {
public:
    RemoteFolder(std::string name, std::optional<std::string> id, std::weak_ptr<RemoteNode> parent);

    /// Дочерний элемент с точным именем.
    /// @return nullptr если такого нет
    /// @throws AmbiguousNameError если их несколько
    std::shared_ptr<RemoteNode> child(const std::string& name);

    /// Идемпотентное создание папки
    /// @throws TypeConflictError если под этим именем лежит файл
    std::shared_ptr<RemoteFolder> mkdir(const std::string& name);

    /// Загрузить новый файл через резюмируемый движок
    /// @throws AlreadyExistsError если имя занято
    std::shared_ptr<RemoteLeaf> uploadLeaf(const std::string& name,
                                           const std::string& localSource,
                                           int64_t chunkSize = DEFAULT_CHUNK_SIZE,
                                           const ProgressCallback& progress = nullptr);

    /// Разрешить путь "a/b/c" относительно этой папки.
    /// @return nullptr если какого-то сегмента нет
    /// @throws UnsupportedOperationError если путь проходит через файл
    ///         или папка удалена
    std::shared_ptr<RemoteNode> resolvePath(const std::string& path);
};

// ═══════════════════════════════════════════════════════════
// RemoteLeaf
// ═══════════════════════════════════════════════════════════

class CA_API RemoteLeaf : public RemoteNode {
public:
    RemoteLeaf(std::string name, std::optional<std::string> id, std::weak_ptr<RemoteNode> parent);

    /// Резюмируемое скачивание в localDestination
    /// @return итоговый размер локального файла
    int64_t receive(const std::string& localDestination,
                    int64_t chunkSize = DEFAULT_CHUNK_SIZE,
                    const ProgressCallback& progress = nullptr);

    /// Заполнено только пока идёт передача
    const std::optional<TransferState>& transferState() const { return m_transferState; }

private:
    std::optional<TransferState> m_transferState;
};

// ═══════════════════════════════════════════════════════════
// RemoteRoot — корень иерархии, держит контекст
// ═══════════════════════════════════════════════════════════

class CA_API RemoteRoot : public RemoteFolder {
public:
    static std::shared_ptr<RemoteRoot> create(std::shared_ptr<DriveApi> session,
                                              std::shared_ptr<UploadJournal> journal,
                                              const std::string& rootId = "root");

    /// Перенести корень в другую папку (например, выделенную под хранилище)
    void setRoot(const RemoteFolder& folder);

    /// Корень удалять нельзя
    void remove() override;

private:
    explicit RemoteRoot(const std::string& rootId);
};

} // namespace CloudAnnex
