#include "rule_source.h"
#include "core/log_manager.h"
#include <QFile>
#include <QStringList>

namespace {

bool isBlank(QChar c) {
    return c == QLatin1Char(' ') || c == QLatin1Char('\t') || c == QLatin1Char('\f');
}

qsizetype skipBlanks(const QString& s, qsizetype pos) {
    while (pos < s.size() && isBlank(s[pos]))
        ++pos;
    return pos;
}

// A line continues when it ends in an odd number of backslashes.
bool continues(const QString& line) {
    int slashes = 0;
    for (qsizetype i = line.size() - 1; i >= 0 && line[i] == QLatin1Char('\\'); --i)
        ++slashes;
    return slashes % 2 == 1;
}

std::optional<QString> unescape(const QString& in) {
    QString out;
    out.reserve(in.size());
    for (qsizetype i = 0; i < in.size(); ++i) {
        const QChar c = in[i];
        if (c != QLatin1Char('\\') || i + 1 >= in.size()) {
            out.append(c);
            continue;
        }
        const QChar e = in[++i];
        switch (e.unicode()) {
        case 't': out.append(QLatin1Char('\t')); break;
        case 'n': out.append(QLatin1Char('\n')); break;
        case 'r': out.append(QLatin1Char('\r')); break;
        case 'f': out.append(QLatin1Char('\f')); break;
        case 'u': {
            if (i + 4 >= in.size())
                return std::nullopt;
            bool ok = false;
            const ushort code = in.mid(i + 1, 4).toUShort(&ok, 16);
            if (!ok)
                return std::nullopt;
            out.append(QChar(code));
            i += 4;
            break;
        }
        default:
            out.append(e);
            break;
        }
    }
    return out;
}

}

namespace RuleSource {

Result<QMap<QString, QString>> parse(const QString& text, const QString& origin) {
    QString normalized = text;
    normalized.replace(QStringLiteral("\r\n"), QStringLiteral("\n"));
    normalized.replace(QLatin1Char('\r'), QLatin1Char('\n'));
    const QStringList lines = normalized.split(QLatin1Char('\n'));

    QMap<QString, QString> entries;
    for (qsizetype n = 0; n < lines.size(); ++n) {
        const qsizetype firstLine = n + 1;
        QString logical = lines[n].mid(skipBlanks(lines[n], 0));
        if (logical.isEmpty()
            || logical.startsWith(QLatin1Char('#'))
            || logical.startsWith(QLatin1Char('!')))
            continue;

        while (continues(logical)) {
            logical.chop(1);
            if (++n >= lines.size())
                break;
            logical += lines[n].mid(skipBlanks(lines[n], 0));
        }

        // Find the end of the key.
        qsizetype pos = 0;
        while (pos < logical.size()) {
            const QChar c = logical[pos];
            if (c == QLatin1Char('\\')) {
                pos += 2;
                continue;
            }
            if (c == QLatin1Char('=') || c == QLatin1Char(':') || isBlank(c))
                break;
            ++pos;
        }
        pos = qMin(pos, logical.size());
        const QString rawKey = logical.left(pos);

        pos = skipBlanks(logical, pos);
        if (pos < logical.size()
            && (logical[pos] == QLatin1Char('=') || logical[pos] == QLatin1Char(':')))
            ++pos;
        pos = skipBlanks(logical, pos);
        const QString rawValue = logical.mid(pos);

        const auto key = unescape(rawKey);
        const auto value = unescape(rawValue);
        if (!key || !value) {
            return std::unexpected(ConfigFailure::invalidConfig(
                QStringLiteral("%1:%2: malformed \\uxxxx escape")
                    .arg(origin.isEmpty() ? QStringLiteral("<text>") : origin)
                    .arg(firstLine)));
        }
        entries.insert(*key, *value);
    }
    return entries;
}

Result<QMap<QString, QString>> loadFile(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_ERROR(QStringLiteral("Cannot open rule file: %1").arg(path));
        return std::unexpected(ConfigFailure::notFound(path));
    }

    auto entries = parse(QString::fromUtf8(file.readAll()), path);
    if (entries) {
        LogManager::instance().log(LogManager::Info, QStringLiteral("config"),
                                   QStringLiteral("Loaded %1 rules from %2")
                                       .arg(entries->size())
                                       .arg(path));
    }
    return entries;
}

Result<QMap<QString, QString>> loadResource(const QString& name) {
    const QString path = name.startsWith(QStringLiteral(":/"))
        ? name
        : QStringLiteral(":/") + name;
    if (!QFile::exists(path)) {
        return std::unexpected(ConfigFailure{
            FailureKind::NotFound, {}, name,
            QStringLiteral("could not find resource: %1").arg(name)});
    }
    return loadFile(path);
}

}
