#pragma once

#include <QByteArray>

namespace taskvault {
namespace storage {

// Key material that is wiped from memory when released. Move-only so a key
// is never duplicated by accident.
class SecureBytes
{
public:
    SecureBytes() = default;
    explicit SecureBytes(QByteArray data);
    ~SecureBytes();

    SecureBytes(const SecureBytes &) = delete;
    SecureBytes &operator=(const SecureBytes &) = delete;
    SecureBytes(SecureBytes &&other) noexcept;
    SecureBytes &operator=(SecureBytes &&other) noexcept;

    const QByteArray &bytes() const { return m_data; }
    int size() const { return m_data.size(); }
    bool isEmpty() const { return m_data.isEmpty(); }

    SecureBytes clone() const;
    void clear();

private:
    QByteArray m_data;
};

} // namespace storage
} // namespace taskvault
