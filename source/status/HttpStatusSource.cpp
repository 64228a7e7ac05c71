#include "HttpStatusSource.h"

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUrl>

HttpStatusSource::HttpStatusSource(const QString& baseUrl, QObject* parent)
    : StatusSource(parent)
    , m_nam(new QNetworkAccessManager(this))
    , m_baseUrl(baseUrl)
{
    while (m_baseUrl.endsWith('/')) {
        m_baseUrl.chop(1);
    }
}

HttpStatusSource::~HttpStatusSource() = default;

void HttpStatusSource::fetchStatuses(const QString& projectId)
{
    const QUrl url(QString("%1/projects/%2/images")
                       .arg(m_baseUrl, QString::fromUtf8(QUrl::toPercentEncoding(projectId))));
    if (m_baseUrl.isEmpty() || !url.isValid()) {
        const QString error = QStringLiteral("No valid status endpoint configured");
        QMetaObject::invokeMethod(this, [this, projectId, error]() {
            emit fetchFailed(projectId, error);
        }, Qt::QueuedConnection);
        return;
    }

    QNetworkRequest req(url);
    req.setRawHeader("Accept", "application/json");
    if (!m_token.isEmpty()) {
        req.setRawHeader("Authorization", QByteArray("Bearer ") + m_token.toUtf8());
    }
    req.setTransferTimeout(m_timeoutMs);

    QNetworkReply* reply = m_nam->get(req);
    connect(reply, &QNetworkReply::finished, this, [this, reply, projectId]() {
        reply->deleteLater();

        if (reply->error() != QNetworkReply::NoError) {
            emit fetchFailed(projectId, reply->errorString());
            return;
        }

        QString error;
        bool ok = false;
        const QVector<ImageStatusRecord> records = parseResponse(reply->readAll(), &error, &ok);
        if (!ok) {
            emit fetchFailed(projectId, error);
            return;
        }
        emit statusesFetched(projectId, records);
    });
}

QVector<ImageStatusRecord> HttpStatusSource::parseResponse(const QByteArray& body, QString* error, bool* ok)
{
    QVector<ImageStatusRecord> records;
    if (ok) {
        *ok = false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (error) {
            *error = parseError.errorString();
        }
        return records;
    }

    QJsonArray images;
    if (doc.isArray()) {
        images = doc.array();
    } else if (doc.isObject() && doc.object()["images"].isArray()) {
        images = doc.object()["images"].toArray();
    } else {
        if (error) {
            *error = QStringLiteral("Response has no image list");
        }
        return records;
    }

    records.reserve(images.size());
    for (const auto& value : images) {
        bool recordOk = false;
        ImageStatusRecord record = ImageStatusRecord::fromJson(value.toObject(), &recordOk);
        if (recordOk) {
            records.append(record);
        }
    }

    if (ok) {
        *ok = true;
    }
    return records;
}
