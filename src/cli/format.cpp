#include "cli/format.hpp"

#include <QStringList>
#include <algorithm>

namespace dropline::cli {

QString format_bytes(quint64 bytes) {
    static const char* units[] = {"KiB", "MiB", "GiB", "TiB"};
    if (bytes < 1024) {
        return QStringLiteral("%1 B").arg(bytes);
    }
    double value = static_cast<double>(bytes) / 1024.0;
    int unit = 0;
    while (value >= 1024.0 && unit < 3) {
        value /= 1024.0;
        ++unit;
    }
    return QStringLiteral("%1 %2").arg(value, 0, 'f', 1).arg(QLatin1String(units[unit]));
}

QString format_progress(const transfer::ProgressUpdate& update) {
    const int percent = update.session_total == 0
        ? 100
        : static_cast<int>((update.session_bytes * 100) / update.session_total);
    return QStringLiteral("%1% %2/%3  %4/s")
        .arg(percent, 3)
        .arg(format_bytes(update.session_bytes))
        .arg(format_bytes(update.session_total))
        .arg(format_bytes(static_cast<quint64>(update.bytes_per_second)));
}

std::vector<network::Endpoint> sorted_by_name(std::vector<network::Endpoint> endpoints) {
    std::stable_sort(endpoints.begin(), endpoints.end(), [](const auto& a, const auto& b) {
        return a.name.compare(b.name, Qt::CaseInsensitive) < 0;
    });
    return endpoints;
}

QString format_endpoint_table(const std::vector<network::Endpoint>& endpoints) {
    if (endpoints.empty()) {
        return QStringLiteral("No devices found.\n");
    }

    const auto sorted = sorted_by_name(endpoints);

    qsizetype name_width = 4;
    for (const auto& endpoint : sorted) {
        name_width = std::max(name_width, endpoint.name.size());
    }

    QString out;
    out += QStringLiteral("%1  %2  %3\n")
               .arg(QStringLiteral("NAME"), -static_cast<int>(name_width))
               .arg(QStringLiteral("ID"), -36)
               .arg(QStringLiteral("ADDRESS"));
    for (const auto& endpoint : sorted) {
        out += QStringLiteral("%1  %2  %3:%4\n")
                   .arg(endpoint.name, -static_cast<int>(name_width))
                   .arg(QString::fromStdString(endpoint.id.to_string()), -36)
                   .arg(endpoint.host.toString())
                   .arg(endpoint.port);
    }
    return out;
}

QString format_endpoint_choices(const std::vector<network::Endpoint>& endpoints) {
    QString out;
    int number = 1;
    for (const auto& endpoint : sorted_by_name(endpoints)) {
        out += QStringLiteral("%1) %2 (%3)\n")
                   .arg(QString::number(number++).rightJustified(3), endpoint.name,
                        endpoint.host.toString() + QLatin1Char(':') + QString::number(endpoint.port));
    }
    return out;
}

} // namespace dropline::cli
