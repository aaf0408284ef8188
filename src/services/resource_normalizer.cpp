#include "crcc/resource_normalizer.hpp"

#include <QStringList>

#include "crcc/human_units.hpp"
#include "crcc/telemetry.hpp"

namespace crcc {

namespace {

constexpr char kFieldDelimiter = '|';
constexpr int kMaxRangeExpansion = 1024;

QStringList splitFields(const QString& line) {
    QStringList fields = line.split(kFieldDelimiter);
    for (QString& field : fields) {
        field = field.trimmed();
    }
    return fields;
}

void dropLine(const QString& source, const QString& line) {
    Telemetry::instance().incrementCounter("normalizer.cli_lines_dropped");
    Telemetry::instance().recordEvent("cli_line_dropped", {
        {"source", source},
        {"line", line.left(200)},
    });
}

// "8000-8001" -> {8000, 8001}; "80" -> {80, 80}.
bool parsePortRange(const QString& text, int* first, int* last) {
    const int dash = text.indexOf('-');
    bool ok1 = false;
    bool ok2 = false;
    if (dash < 0) {
        *first = text.toInt(&ok1);
        *last = *first;
        return ok1;
    }
    *first = text.left(dash).toInt(&ok1);
    *last = text.mid(dash + 1).toInt(&ok2);
    return ok1 && ok2 && *last >= *first && (*last - *first) < kMaxRangeExpansion;
}

}  // namespace

QString ResourceNormalizer::stripNamePrefix(const QString& name) {
    return name.startsWith('/') ? name.mid(1) : name;
}

QString ResourceNormalizer::stripDigestPrefix(const QString& id) {
    const int idx = id.indexOf(':');
    return idx >= 0 ? id.mid(idx + 1) : id;
}

QMap<QString, QString> ResourceNormalizer::labelsFromJson(const QJsonValue& value) {
    QMap<QString, QString> labels;
    const QJsonObject object = value.toObject();
    for (auto it = object.constBegin(); it != object.constEnd(); ++it) {
        labels.insert(it.key(), it.value().toString());
    }
    return labels;
}

ContainerRecord ResourceNormalizer::containerFromApi(const QJsonObject& raw) {
    ContainerRecord container;
    container.id = raw.value("Id").toString();
    for (const QJsonValue& name : raw.value("Names").toArray()) {
        container.names.append(stripNamePrefix(name.toString()));
    }
    container.image = raw.value("Image").toString();
    container.state = raw.value("State").toString();
    container.status = raw.value("Status").toString();
    container.labels = labelsFromJson(raw.value("Labels"));
    for (const QJsonValue& value : raw.value("Ports").toArray()) {
        const QJsonObject port = value.toObject();
        PortBinding binding;
        binding.hostIp = port.value("IP").toString();
        binding.containerPort = port.value("PrivatePort").toInt();
        binding.hostPort = port.value("PublicPort").toInt();
        const QString type = port.value("Type").toString();
        binding.protocol = type.isEmpty() ? QString("tcp") : type;
        container.ports.append(binding);
    }
    container.created = raw.value("Created").toInteger();
    return container;
}

QVector<ContainerRecord> ResourceNormalizer::containersFromApi(const QJsonArray& raw) {
    QVector<ContainerRecord> out;
    out.reserve(raw.size());
    for (const QJsonValue& value : raw) {
        out.append(containerFromApi(value.toObject()));
    }
    return out;
}

ImageRecord ResourceNormalizer::imageFromApi(const QJsonObject& raw) {
    ImageRecord image;
    image.id = stripDigestPrefix(raw.value("Id").toString());
    for (const QJsonValue& tag : raw.value("RepoTags").toArray()) {
        image.repoTags.append(tag.toString());
    }
    image.size = static_cast<quint64>(qMax<qint64>(0, raw.value("Size").toInteger()));
    image.created = raw.value("Created").toInteger();
    return image;
}

QVector<ImageRecord> ResourceNormalizer::imagesFromApi(const QJsonArray& raw) {
    QVector<ImageRecord> out;
    out.reserve(raw.size());
    for (const QJsonValue& value : raw) {
        out.append(imageFromApi(value.toObject()));
    }
    return out;
}

ContainerDetail ResourceNormalizer::detailFromInspect(const QJsonObject& raw) {
    ContainerDetail detail;
    const QJsonObject config = raw.value("Config").toObject();
    const QJsonObject hostConfig = raw.value("HostConfig").toObject();
    const QJsonObject state = raw.value("State").toObject();
    const QJsonObject networkSettings = raw.value("NetworkSettings").toObject();

    ContainerRecord& summary = detail.summary;
    summary.id = raw.value("Id").toString();
    const QString name = stripNamePrefix(raw.value("Name").toString());
    if (!name.isEmpty()) {
        summary.names.append(name);
    }
    summary.image = config.value("Image").toString();
    summary.state = state.value("Status").toString("unknown");
    summary.status = summary.state;
    summary.labels = labelsFromJson(config.value("Labels"));

    detail.createdText = raw.value("Created").toString();
    if (!detail.createdText.isEmpty()) {
        bool ok = false;
        summary.created = parseTimestamp(detail.createdText, &ok);
        summary.createdEstimated = !ok;
    }

    QStringList command;
    for (const QJsonValue& part : config.value("Cmd").toArray()) {
        command.append(part.toString());
    }
    detail.command = command.join(' ');
    for (const QJsonValue& entry : config.value("Env").toArray()) {
        detail.env.append(entry.toString());
    }

    detail.networkMode = hostConfig.value("NetworkMode").toString();
    const QString restart = hostConfig.value("RestartPolicy").toObject().value("Name").toString();
    detail.restartPolicy = restart.isEmpty() ? QString("no") : restart;

    // "80/tcp": [{"HostIp": "0.0.0.0", "HostPort": "8080"}, {"HostIp": "::", ...}]
    const QJsonObject portMap = networkSettings.value("Ports").toObject();
    for (auto it = portMap.constBegin(); it != portMap.constEnd(); ++it) {
        const QStringList parts = it.key().split('/');
        const int containerPort = parts.value(0).toInt();
        const QString protocol = parts.value(1).isEmpty() ? QString("tcp") : parts.value(1);
        for (const QJsonValue& bindingValue : it.value().toArray()) {
            const QJsonObject binding = bindingValue.toObject();
            PortBinding port;
            port.hostIp = binding.value("HostIp").toString();
            port.hostPort = binding.value("HostPort").toString().toInt();
            port.containerPort = containerPort;
            port.protocol = protocol;
            summary.ports.append(port);
        }
    }

    for (const QJsonValue& value : raw.value("Mounts").toArray()) {
        const QJsonObject mount = value.toObject();
        detail.volumes.append(VolumeMount{
            mount.value("Source").toString(),
            mount.value("Destination").toString(),
            mount.value("Mode").toString(),
        });
    }
    return detail;
}

QVector<ImageRecord> ResourceNormalizer::imagesFromCli(const QString& output) {
    QVector<ImageRecord> images;
    for (const QString& line : output.split('\n', Qt::SkipEmptyParts)) {
        const QStringList fields = splitFields(line);
        if (fields.size() < kImageFieldCount) {
            dropLine("images", line);
            continue;
        }
        ImageRecord image;
        image.id = stripDigestPrefix(fields[0]);
        image.repoTags.append(fields[1]);
        image.size = parseSize(fields[2]);
        bool ok = false;
        image.created = parseTimestamp(fields[3], &ok);
        image.createdEstimated = !ok;
        images.append(image);
    }
    return images;
}

QVector<ContainerRecord> ResourceNormalizer::containersFromCli(const QString& output) {
    QVector<ContainerRecord> containers;
    for (const QString& line : output.split('\n', Qt::SkipEmptyParts)) {
        const QStringList fields = splitFields(line);
        if (fields.size() < kContainerFieldCount) {
            dropLine("containers", line);
            continue;
        }
        ContainerRecord container;
        container.id = fields[0];
        for (const QString& name : fields[1].split(',', Qt::SkipEmptyParts)) {
            container.names.append(stripNamePrefix(name.trimmed()));
        }
        container.image = fields[2];
        container.state = fields[3];
        container.status = fields[4];
        bool ok = false;
        container.created = parseTimestamp(fields[5], &ok);
        container.createdEstimated = !ok;
        container.labels = parseLabelList(fields[6]);
        container.ports = parsePortList(fields[7]);
        containers.append(container);
    }
    return containers;
}

QVector<PortBinding> ResourceNormalizer::parsePortList(const QString& text) {
    QVector<PortBinding> ports;
    for (const QString& rawEntry : text.split(',', Qt::SkipEmptyParts)) {
        const QString entry = rawEntry.trimmed();
        if (entry.isEmpty()) {
            continue;
        }

        QString hostPart;
        QString containerPart = entry;
        const int arrow = entry.indexOf("->");
        if (arrow >= 0) {
            hostPart = entry.left(arrow);
            containerPart = entry.mid(arrow + 2);
        }

        const int slash = containerPart.indexOf('/');
        const QString protocol = slash >= 0 ? containerPart.mid(slash + 1) : QString("tcp");
        int containerFirst = 0;
        int containerLast = 0;
        if (!parsePortRange(slash >= 0 ? containerPart.left(slash) : containerPart,
                            &containerFirst, &containerLast)) {
            continue;
        }

        QString hostIp;
        int hostFirst = 0;
        int hostLast = 0;
        if (!hostPart.isEmpty()) {
            const int colon = hostPart.lastIndexOf(':');
            hostIp = colon >= 0 ? hostPart.left(colon) : QString();
            if (hostIp.startsWith('[') && hostIp.endsWith(']')) {
                hostIp = hostIp.mid(1, hostIp.size() - 2);
            }
            if (!parsePortRange(hostPart.mid(colon + 1), &hostFirst, &hostLast)) {
                continue;
            }
        }

        for (int offset = 0; containerFirst + offset <= containerLast; ++offset) {
            PortBinding binding;
            binding.hostIp = hostIp;
            binding.containerPort = containerFirst + offset;
            binding.hostPort = hostFirst > 0 ? qMin(hostFirst + offset, hostLast) : 0;
            binding.protocol = protocol.isEmpty() ? QString("tcp") : protocol;
            ports.append(binding);
        }
    }
    return ports;
}

QMap<QString, QString> ResourceNormalizer::parseLabelList(const QString& text) {
    QMap<QString, QString> labels;
    QString key;
    QString value;
    const auto flush = [&labels, &key, &value]() {
        if (!key.isEmpty()) {
            labels.insert(key, value.trimmed());
        }
        key.clear();
        value.clear();
    };

    for (const QString& segment : text.split(',')) {
        const int eq = segment.indexOf('=');
        if (eq < 0 && !key.isEmpty()) {
            // The tool joins pairs with ',' unescaped, so this belongs to the previous value.
            value += ',' + segment;
            continue;
        }
        flush();
        key = (eq >= 0 ? segment.left(eq) : segment).trimmed();
        value = eq >= 0 ? segment.mid(eq + 1) : QString();
        if (eq < 0 && !key.isEmpty()) {
            // A bare key before any pair has no value to join.
            labels.insert(key, QString());
            key.clear();
        }
    }
    flush();
    return labels;
}

}  // namespace crcc
