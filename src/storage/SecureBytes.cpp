#include "taskvault/storage/SecureBytes.hpp"

#include <openssl/crypto.h>

#include <utility>

namespace taskvault {
namespace storage {

SecureBytes::SecureBytes(QByteArray data)
    : m_data(std::move(data))
{
}

SecureBytes::~SecureBytes()
{
    clear();
}

SecureBytes::SecureBytes(SecureBytes &&other) noexcept
    : m_data(std::move(other.m_data))
{
    other.m_data = QByteArray();
}

SecureBytes &SecureBytes::operator=(SecureBytes &&other) noexcept
{
    if (this != &other) {
        clear();
        m_data = std::move(other.m_data);
        other.m_data = QByteArray();
    }
    return *this;
}

SecureBytes SecureBytes::clone() const
{
    return SecureBytes(QByteArray(m_data.constData(), m_data.size()));
}

void SecureBytes::clear()
{
    if (!m_data.isEmpty()) {
        OPENSSL_cleanse(m_data.data(), static_cast<size_t>(m_data.size()));
    }
    m_data.clear();
}

} // namespace storage
} // namespace taskvault
