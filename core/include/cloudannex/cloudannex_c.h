// cloudannex_c.h — C API для FFI
// Результаты возвращаются JSON-строками, освобождать через ca_free_string

#ifndef CLOUDANNEX_C_H
#define CLOUDANNEX_C_H

#include "export.h"
#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// ═══════════════════════════════════════════════════════════
// Opaque handles
// ═══════════════════════════════════════════════════════════

typedef struct CADrive_* CADrive;

// ═══════════════════════════════════════════════════════════
// Коды ошибок
// ═══════════════════════════════════════════════════════════

typedef enum {
    CA_OK = 0,
    CA_ERROR_INVALID_ARGUMENT = 1,
    CA_ERROR_DATABASE = 2,
    CA_ERROR_IO = 3,
    CA_ERROR_NOT_FOUND = 4,
    CA_ERROR_ALREADY_EXISTS = 5,
    CA_ERROR_AMBIGUOUS = 6,
    CA_ERROR_TYPE_CONFLICT = 7,
    CA_ERROR_CHECKSUM_MISMATCH = 8,
    CA_ERROR_NETWORK = 9,
    CA_ERROR_UNSUPPORTED = 10,
    CA_ERROR_INTERNAL = 99
} CAError;

/// Прогресс передачи: накопленное число подтверждённых байт
typedef void (*CAProgressCallback)(int64_t bytes, void* user_data);

// ═══════════════════════════════════════════════════════════
// Общие функции
// ═══════════════════════════════════════════════════════════

/// Возвращает версию библиотеки
CA_API const char* ca_version(void);

/// Возвращает текстовое описание ошибки
CA_API const char* ca_error_message(CAError error);

/// Получить последнюю ошибку (thread-local)
CA_API CAError ca_last_error(void);

/// Получить сообщение последней ошибки (thread-local)
CA_API const char* ca_last_error_message(void);

/// Очистить состояние ошибки
CA_API void ca_clear_error(void);

/// Освобождает строку, выделенную библиотекой
CA_API void ca_free_string(char* str);

/// Уровень логирования: "trace", "debug", "info", "warn", "error", "critical", "off"
CA_API CAError ca_set_log_level(const char* level);

// ═══════════════════════════════════════════════════════════
// Drive
// ═══════════════════════════════════════════════════════════

/// Подключиться к хранилищу. config_json — см. DriveConfig.
/// Если задан journalPath, открывается журнал загрузок.
CA_API CADrive ca_drive_open(const char* config_json, CAError* out_error);

CA_API void ca_drive_close(CADrive drive);

/// Элемент по пути от корня: {"name","id","kind"}.
/// NULL и CA_ERROR_NOT_FOUND если пути нет.
CA_API char* ca_drive_stat(CADrive drive, const char* path);

/// Создать папки по пути (существующие используются как есть)
CA_API char* ca_drive_mkdir(CADrive drive, const char* path);

/// Загрузить local_path в папку remote_folder под именем name
/// @return JSON нового элемента
CA_API char* ca_drive_upload(CADrive drive,
                             const char* local_path,
                             const char* remote_folder,
                             const char* name,
                             CAProgressCallback cb,
                             void* user_data);

/// Докачать файл remote_path в local_path
/// @return итоговый размер локального файла, -1 при ошибке
CA_API int64_t ca_drive_download(CADrive drive,
                                 const char* remote_path,
                                 const char* local_path,
                                 CAProgressCallback cb,
                                 void* user_data);

CA_API CAError ca_drive_remove(CADrive drive, const char* remote_path);

/// Незавершённые загрузки из журнала (JSON array, "[]" без журнала)
CA_API char* ca_drive_pending_uploads(CADrive drive);

/// Удалить запись незавершённой загрузки из журнала
CA_API CAError ca_drive_abandon_upload(CADrive drive, int64_t session_id);

#ifdef __cplusplus
}
#endif

#endif // CLOUDANNEX_C_H
