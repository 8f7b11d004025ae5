#pragma once

#include "taskvault/data/DocumentRepository.hpp"
#include "taskvault/data/Settings.hpp"

namespace taskvault {
namespace data {

class SettingsRepository : public DocumentRepository
{
public:
    explicit SettingsRepository(std::shared_ptr<storage::EncryptedStore> store,
                                PersistMode mode = PersistMode::Immediate);
    ~SettingsRepository() override;

    Settings settings() const;

    // Validates the merged record before applying it. Throws
    // core::ValidationError and leaves the settings untouched on failure.
    Settings update(const SettingsPatch &patch);

    void recordDailyReset(const QDateTime &when);
    void recordAutomaticBackup(const QDateTime &when);

protected:
    QJsonDocument serializeLocked() const override;
    void deserializeLocked(const QJsonDocument &document) override;
    void resetLocked() override;

private:
    Settings m_settings;
};

} // namespace data
} // namespace taskvault
