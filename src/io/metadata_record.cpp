#include "geoseq/io/metadata_record.hpp"
#include "geoseq/core/errors.hpp"
#include "geoseq/core/utils.hpp"

#include <QString>
#include <QXmlStreamReader>

#include <cmath>

namespace geoseq::io {

namespace {

// "http://ns.exiftool.org/QuickTime/Track1/1.0/" -> "Track1"
std::string group_from_namespace(const QString& uri, const QString& prefix) {
    QStringList parts = uri.split('/', Qt::SkipEmptyParts);
    if (uri.contains("ns.exiftool.org") && parts.size() >= 3) {
        return parts[parts.size() - 2].toStdString();
    }
    return prefix.toStdString();
}

// Text of a tag element, joining rdf:li items of list values with spaces
std::string read_tag_text(QXmlStreamReader& xml) {
    std::string text;
    int depth = 1;
    while (depth > 0 && !xml.atEnd()) {
        const auto token = xml.readNext();
        if (token == QXmlStreamReader::StartElement) {
            ++depth;
        } else if (token == QXmlStreamReader::EndElement) {
            --depth;
            if (depth >= 1 && xml.name() == QLatin1String("li")) {
                text += ' ';
            }
        } else if (token == QXmlStreamReader::Characters && !xml.isWhitespace()) {
            text += xml.text().toString().toStdString();
        }
    }
    return core::trim(text);
}

} // namespace

void MetadataRecord::add(const std::string& key, const std::string& value) {
    entries.emplace_back(key, value);
}

std::optional<std::string> MetadataRecord::get(const std::string& key) const {
    for (const auto& [k, v] : entries) {
        if (k == key) {
            return v;
        }
    }
    return std::nullopt;
}

std::vector<std::string> MetadataRecord::get_all(const std::string& key) const {
    std::vector<std::string> out;
    for (const auto& [k, v] : entries) {
        if (k == key) {
            out.push_back(v);
        }
    }
    return out;
}

std::optional<double> MetadataRecord::get_double(const std::string& key) const {
    auto v = get(key);
    if (!v) {
        return std::nullopt;
    }
    return core::parse_double(*v);
}

std::optional<int> MetadataRecord::get_int(const std::string& key) const {
    auto v = get_double(key);
    if (!v) {
        return std::nullopt;
    }
    return static_cast<int>(std::lround(*v));
}

bool MetadataRecord::has(const std::string& key) const {
    return get(key).has_value();
}

std::vector<MetadataRecord> parse_exiftool_xml(const std::string& xml_text) {
    std::vector<MetadataRecord> records;
    QXmlStreamReader xml(QString::fromStdString(xml_text));

    MetadataRecord* current = nullptr;
    while (!xml.atEnd()) {
        const auto token = xml.readNext();
        if (token == QXmlStreamReader::StartElement) {
            if (xml.name() == QLatin1String("Description") &&
                xml.namespaceUri() == QLatin1String("http://www.w3.org/1999/02/22-rdf-syntax-ns#")) {
                records.emplace_back();
                current = &records.back();
                current->about = xml.attributes()
                                     .value("http://www.w3.org/1999/02/22-rdf-syntax-ns#", "about")
                                     .toString()
                                     .toStdString();
            } else if (current) {
                const std::string key = group_from_namespace(xml.namespaceUri().toString(),
                                                             xml.prefix().toString()) +
                                        ":" + xml.name().toString().toStdString();
                current->add(key, read_tag_text(xml));
            }
        } else if (token == QXmlStreamReader::EndElement) {
            if (xml.name() == QLatin1String("Description")) {
                current = nullptr;
            }
        }
    }

    if (xml.hasError()) {
        throw ParseError("Invalid exiftool XML: " + xml.errorString().toStdString());
    }
    return records;
}

const MetadataRecord* find_record_for(const std::vector<MetadataRecord>& records, const fs::path& file) {
    std::error_code ec;
    const fs::path canonical = fs::weakly_canonical(file, ec);
    for (const auto& rec : records) {
        std::error_code ec2;
        if (!ec && fs::weakly_canonical(fs::path(rec.about), ec2) == canonical && !ec2) {
            return &rec;
        }
    }
    for (const auto& rec : records) {
        if (fs::path(rec.about).filename() == file.filename()) {
            return &rec;
        }
    }
    return nullptr;
}

MetadataRecord ExiftoolMetadataReader::read(const fs::path& path) {
    auto records = parse_exiftool_xml(runner_.run(path));
    if (records.empty()) {
        throw ParseError("exiftool reported no metadata for " + path.string());
    }
    return records.front();
}

} // namespace geoseq::io
