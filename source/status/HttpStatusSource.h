#pragma once

// ============================================================================
// HttpStatusSource - StatusSource backed by the project images endpoint
// ============================================================================
// GET {baseUrl}/projects/{projectId}/images
//     Authorization: Bearer <token>   (only when a token is set)
//
// Accepts {"images": [...]} or a bare array. Images with an unknown status
// string are skipped with a warning; the rest of the list still applies.
// ============================================================================

#include "StatusSource.h"

#include <QByteArray>

class QNetworkAccessManager;

class HttpStatusSource : public StatusSource {
    Q_OBJECT

public:
    explicit HttpStatusSource(const QString& baseUrl, QObject* parent = nullptr);
    ~HttpStatusSource() override;

    void setToken(const QString& token) { m_token = token; }
    void setTimeout(int ms) { m_timeoutMs = qMax(100, ms); }

    QString baseUrl() const { return m_baseUrl; }

    void fetchStatuses(const QString& projectId) override;

    /**
     * @brief Decode a response body.
     * @param ok Set to false when the body is not JSON or has no image list.
     */
    static QVector<ImageStatusRecord> parseResponse(const QByteArray& body, QString* error = nullptr, bool* ok = nullptr);

private:
    QNetworkAccessManager* m_nam = nullptr;
    QString m_baseUrl;
    QString m_token;
    int m_timeoutMs = 5000;
};
