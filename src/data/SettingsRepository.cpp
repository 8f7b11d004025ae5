#include "taskvault/data/SettingsRepository.hpp"

#include "taskvault/core/Logging.hpp"

#include <QMutexLocker>

namespace taskvault {
namespace data {

namespace {
constexpr auto DOCUMENT_NAME = "settings";
}

SettingsRepository::SettingsRepository(std::shared_ptr<storage::EncryptedStore> store, PersistMode mode)
    : DocumentRepository(std::move(store), QLatin1String(DOCUMENT_NAME), mode)
{
}

SettingsRepository::~SettingsRepository() = default;

Settings SettingsRepository::settings() const
{
    QMutexLocker locker(&stateMutex());
    return m_settings;
}

Settings SettingsRepository::update(const SettingsPatch &patch)
{
    Settings updated;
    {
        QMutexLocker locker(&stateMutex());
        ensureAvailableLocked();
        updated = applyPatch(m_settings, patch);
        validateSettings(updated);
        if (patch.isEmpty()) {
            return updated;
        }
        m_settings = updated;
        markDirtyLocked();
    }
    qCInfo(core::lcData) << "settings updated";
    persistIfImmediate();
    return updated;
}

void SettingsRepository::recordDailyReset(const QDateTime &when)
{
    {
        QMutexLocker locker(&stateMutex());
        ensureAvailableLocked();
        m_settings.lastDailyReset = when;
        markDirtyLocked();
    }
    persistIfImmediate();
}

void SettingsRepository::recordAutomaticBackup(const QDateTime &when)
{
    {
        QMutexLocker locker(&stateMutex());
        ensureAvailableLocked();
        m_settings.lastAutomaticBackup = when;
        markDirtyLocked();
    }
    persistIfImmediate();
}

QJsonDocument SettingsRepository::serializeLocked() const
{
    return QJsonDocument(settingsToJson(m_settings));
}

void SettingsRepository::deserializeLocked(const QJsonDocument &document)
{
    m_settings = settingsFromJson(document.object());
}

void SettingsRepository::resetLocked()
{
    m_settings = Settings();
}

} // namespace data
} // namespace taskvault
