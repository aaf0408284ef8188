#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QVector>

#include "crcc/resource_types.hpp"

namespace crcc {

// Maps engine API objects and CLI template output onto the canonical records.
// All functions are pure; missing optional fields fall back to empty/zero.
class ResourceNormalizer {
public:
    // Fields in the CLI --format templates, joined by '|'.
    static constexpr int kImageFieldCount = 4;
    static constexpr int kContainerFieldCount = 8;

    static QString stripNamePrefix(const QString& name);
    static QString stripDigestPrefix(const QString& id);

    static ContainerRecord containerFromApi(const QJsonObject& raw);
    static QVector<ContainerRecord> containersFromApi(const QJsonArray& raw);
    static ImageRecord imageFromApi(const QJsonObject& raw);
    static QVector<ImageRecord> imagesFromApi(const QJsonArray& raw);
    static ContainerDetail detailFromInspect(const QJsonObject& raw);

    // Lines with fewer fields than the template produces are dropped.
    static QVector<ImageRecord> imagesFromCli(const QString& output);
    static QVector<ContainerRecord> containersFromCli(const QString& output);

    static QVector<PortBinding> parsePortList(const QString& text);
    // "k=v,k2=v2" as printed by the CLI. Commas are not escaped there, so a
    // segment without '=' continues the previous value ("d=a, b" stays whole);
    // only before the first pair is such a segment a key with an empty value.
    static QMap<QString, QString> parseLabelList(const QString& text);

private:
    static QMap<QString, QString> labelsFromJson(const QJsonValue& value);
};

}  // namespace crcc
