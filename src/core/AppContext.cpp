#include "taskvault/core/AppContext.hpp"

#include "taskvault/core/AutoSaveWorker.hpp"
#include "taskvault/core/DailyResetScheduler.hpp"
#include "taskvault/core/Errors.hpp"
#include "taskvault/core/Logging.hpp"
#include "taskvault/data/SettingsRepository.hpp"
#include "taskvault/data/TaskRepository.hpp"
#include "taskvault/storage/EncryptedStore.hpp"
#include "taskvault/storage/KeyManager.hpp"
#include "taskvault/storage/SecureBytes.hpp"

#include "version.h"

namespace taskvault {
namespace core {

namespace {
storage::StorageLocation resolveLocation(const AppConfig &config)
{
    const storage::PathResolver resolver(storage::PathResolver::defaultCandidates(config.installDir, config.dataDir));
    return resolver.resolve();
}
} // namespace

AppContext::AppContext(AppConfig config)
    : AppContext(config, resolveLocation(config))
{
}

AppContext::AppContext(AppConfig config, storage::StorageLocation location)
    : m_config(std::move(config))
    , m_location(std::move(location))
    , m_clock([] { return QDateTime::currentDateTime(); })
    , m_store(std::make_shared<storage::EncryptedStore>(m_location.activeRoot))
    , m_keyManager(std::make_unique<storage::KeyManager>(*m_store, m_config.kdfIterations))
    , m_tasks(std::make_unique<data::TaskRepository>(m_store))
    , m_settings(std::make_unique<data::SettingsRepository>(m_store))
    , m_backups(std::make_unique<storage::BackupManager>(m_store, QString::fromLatin1(kTaskVaultVersion)))
    , m_autoSave(std::make_unique<AutoSaveWorker>())
    , m_dailyReset(std::make_unique<DailyResetScheduler>([this](const QDateTime &when) { runDailyReset(when); }))
{
    for (const AttemptedPath &failure : m_location.failures) {
        qCWarning(lcStorage) << "storage candidate rejected:" << failure.path << probeFailureName(failure.reason)
                             << failure.detail;
    }
    qCInfo(lcApp) << "storage root" << m_location.activeRoot;

    m_autoSave->addRepository(m_tasks.get());
    m_autoSave->addRepository(m_settings.get());

    m_store->sweepTemporaryFiles();
    m_backups->sweepStaging();
    m_backups->recover();
    m_keyManager->recover();
}

AppContext::~AppContext()
{
    shutdown();
}

const AppConfig &AppContext::config() const
{
    return m_config;
}

const storage::StorageLocation &AppContext::storageLocation() const
{
    return m_location;
}

bool AppContext::isInitialized() const
{
    return m_keyManager->hasEnvelope();
}

bool AppContext::isUnlocked() const
{
    return m_unlocked;
}

void AppContext::initialize(const QString &password)
{
    openSession(m_keyManager->initialize(password));
    qCInfo(lcApp) << "storage initialized";
}

void AppContext::login(const QString &password)
{
    openSession(m_keyManager->login(password));
    qCInfo(lcApp) << "unlocked";
}

void AppContext::changePassword(const QString &oldPassword, const QString &newPassword)
{
    requireUnlocked();
    flush();
    m_keyManager->changePassword(oldPassword, newPassword);
}

data::TaskRepository &AppContext::tasks()
{
    requireUnlocked();
    return *m_tasks;
}

data::Settings AppContext::settings() const
{
    requireUnlocked();
    return m_settings->settings();
}

data::Settings AppContext::updateSettings(const data::SettingsPatch &patch)
{
    requireUnlocked();
    const data::Settings updated = m_settings->update(patch);
    applySettings(updated);
    return updated;
}

std::vector<storage::BackupInfo> AppContext::listBackups() const
{
    return m_backups->list();
}

storage::BackupInfo AppContext::createBackup(storage::BackupType type)
{
    requireUnlocked();
    flush();
    storage::BackupInfo info = m_backups->create(type);
    if (type == storage::BackupType::Automatic) {
        m_settings->recordAutomaticBackup(info.createdAt);
        m_backups->prune();
    }
    return info;
}

void AppContext::restoreBackup(const QString &name)
{
    requireUnlocked();
    const std::optional<storage::BackupInfo> info = m_backups->find(name);
    if (!info) {
        throw NotFound(QStringLiteral("backup"), name);
    }
    if (info->formatVersion != storage::BackupManager::kFormatVersion) {
        throw VersionMismatch(info->formatVersion, storage::BackupManager::kFormatVersion);
    }

    createBackup(storage::BackupType::PreRestore);
    m_tasks->reloadAfter([this, &name] { m_settings->reloadAfter([this, &name] { m_backups->restore(name); }); });

    const data::Settings restored = m_settings->settings();
    applySettings(restored);
    m_dailyReset->setLastReset(restored.lastDailyReset);
    qCInfo(lcApp) << "restored backup" << name;
}

void AppContext::startBackgroundWork()
{
    requireUnlocked();
    if (m_backgroundStarted) {
        return;
    }
    m_tasks->setPersistMode(data::PersistMode::Deferred);
    m_settings->setPersistMode(data::PersistMode::Deferred);
    m_autoSave->start();
    m_dailyReset->start();
    m_backgroundStarted = true;
    createAutomaticBackupIfDue(m_clock());
}

void AppContext::flush()
{
    if (!m_unlocked) {
        return;
    }
    m_tasks->flush();
    m_settings->flush();
}

void AppContext::shutdown()
{
    m_dailyReset->stop();
    m_autoSave->stop();
    if (m_backgroundStarted) {
        m_tasks->setPersistMode(data::PersistMode::Immediate);
        m_settings->setPersistMode(data::PersistMode::Immediate);
        m_backgroundStarted = false;
    }
    try {
        flush();
    } catch (const std::exception &e) {
        qCCritical(lcApp) << "final flush failed, unsaved changes are lost:" << e.what();
    }
}

void AppContext::setClock(std::function<QDateTime()> clock)
{
    m_clock = clock;
    m_tasks->setClock(clock);
    m_backups->setClock(clock);
    m_dailyReset->setClock(std::move(clock));
}

storage::EncryptedStore &AppContext::store()
{
    return *m_store;
}

storage::KeyManager &AppContext::keyManager()
{
    return *m_keyManager;
}

storage::BackupManager &AppContext::backups()
{
    return *m_backups;
}

AutoSaveWorker &AppContext::autoSave()
{
    return *m_autoSave;
}

DailyResetScheduler &AppContext::dailyReset()
{
    return *m_dailyReset;
}

void AppContext::requireUnlocked() const
{
    if (!m_unlocked) {
        throw AuthenticationFailed();
    }
}

void AppContext::openSession(storage::SecureBytes key)
{
    m_store->setKey(std::move(key));
    m_unlocked = true;

    // A corrupted document disables its own repository only.
    for (data::DocumentRepository *repository :
         {static_cast<data::DocumentRepository *>(m_tasks.get()), static_cast<data::DocumentRepository *>(m_settings.get())}) {
        try {
            repository->reload();
        } catch (const DecryptionFailed &e) {
            qCCritical(lcApp) << e.message() << "- restore a backup to recover it";
        }
    }

    const data::Settings current = m_settings->settings();
    applySettings(current);
    m_dailyReset->setLastReset(current.lastDailyReset);
}

void AppContext::runDailyReset(const QDateTime &when)
{
    const int cleared = m_tasks->clearStruckToday();
    m_settings->recordDailyReset(when);
    qCInfo(lcApp) << "daily reset done," << cleared << "tasks cleared";
    createAutomaticBackupIfDue(when);
}

void AppContext::createAutomaticBackupIfDue(const QDateTime &now)
{
    const QDateTime last = m_settings->settings().lastAutomaticBackup;
    if (last.isValid() && last.daysTo(now) < kAutomaticBackupIntervalDays) {
        return;
    }
    try {
        const storage::BackupInfo info = createBackup(storage::BackupType::Automatic);
        qCInfo(lcApp) << "automatic backup" << info.name;
    } catch (const Error &e) {
        qCWarning(lcApp) << "automatic backup failed:" << e.message();
    }
}

void AppContext::applySettings(const data::Settings &settings)
{
    m_autoSave->setInterval(settings.autosaveIntervalSeconds * 1000);
    m_dailyReset->setResetTime(settings.dailyResetTime);
}

} // namespace core
} // namespace taskvault
