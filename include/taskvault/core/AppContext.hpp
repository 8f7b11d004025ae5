#pragma once

#include "taskvault/core/AppConfig.hpp"
#include "taskvault/data/Settings.hpp"
#include "taskvault/storage/BackupManager.hpp"
#include "taskvault/storage/PathResolver.hpp"

#include <QDateTime>

#include <functional>
#include <memory>
#include <vector>

namespace taskvault {
namespace data {
class SettingsRepository;
class TaskRepository;
}

namespace storage {
class EncryptedStore;
class KeyManager;
class SecureBytes;
}

namespace core {

class AutoSaveWorker;
class DailyResetScheduler;

class AppContext
{
public:
    static constexpr int kAutomaticBackupIntervalDays = 7;

    // Resolves the storage root. Throws StorageUnavailable when no
    // candidate is writable.
    explicit AppContext(AppConfig config);
    AppContext(AppConfig config, storage::StorageLocation location);
    ~AppContext();

    AppContext(const AppContext &) = delete;
    AppContext &operator=(const AppContext &) = delete;

    const AppConfig &config() const;
    const storage::StorageLocation &storageLocation() const;

    bool isInitialized() const;
    bool isUnlocked() const;
    void initialize(const QString &password);
    void login(const QString &password);
    void changePassword(const QString &oldPassword, const QString &newPassword);

    data::TaskRepository &tasks();
    data::Settings settings() const;
    data::Settings updateSettings(const data::SettingsPatch &patch);

    std::vector<storage::BackupInfo> listBackups() const;
    storage::BackupInfo createBackup(storage::BackupType type);
    // Takes a pre-restore snapshot first, then replaces the live documents
    // and reloads both repositories from them.
    void restoreBackup(const QString &name);

    // Switches the repositories to deferred writes and starts the autosave
    // and daily reset timers.
    void startBackgroundWork();
    void flush();
    // Stops the timers and writes outstanding changes. Safe to call twice.
    void shutdown();

    void setClock(std::function<QDateTime()> clock);

    storage::EncryptedStore &store();
    storage::KeyManager &keyManager();
    storage::BackupManager &backups();
    AutoSaveWorker &autoSave();
    DailyResetScheduler &dailyReset();

private:
    void requireUnlocked() const;
    void openSession(storage::SecureBytes key);
    void runDailyReset(const QDateTime &when);
    void createAutomaticBackupIfDue(const QDateTime &now);
    void applySettings(const data::Settings &settings);

    AppConfig m_config;
    storage::StorageLocation m_location;
    std::function<QDateTime()> m_clock;
    std::shared_ptr<storage::EncryptedStore> m_store;
    std::unique_ptr<storage::KeyManager> m_keyManager;
    std::unique_ptr<data::TaskRepository> m_tasks;
    std::unique_ptr<data::SettingsRepository> m_settings;
    std::unique_ptr<storage::BackupManager> m_backups;
    std::unique_ptr<AutoSaveWorker> m_autoSave;
    std::unique_ptr<DailyResetScheduler> m_dailyReset;
    bool m_unlocked = false;
    bool m_backgroundStarted = false;
};

} // namespace core
} // namespace taskvault
