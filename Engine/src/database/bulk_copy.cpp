#include <database/bulk_copy.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>

namespace ChainReplay {

BulkCopy::BulkCopy(PostgresConnection& db) noexcept : db_(db) {}

BulkCopy::~BulkCopy() {
    if (!in_copy_) return;
    // Rows not flushed by the owner are abandoned, not committed
    try {
        db_.copy_end("BulkCopy destroyed before flush");
    } catch (const std::exception& e) {
        Logger::warn(std::string("COPY into ") + table_name_ + " aborted: " + e.what());
    }
}

void BulkCopy::begin_table(const std::string& table_name, const std::vector<std::string>& columns) {
    if (in_copy_) {
        throw StorageError("BulkCopy: begin_table while COPY into " + table_name_ + " is active");
    }

    // Split at the last dot: table names here never contain one, schema names may
    auto dot_pos = table_name.rfind('.');
    if (dot_pos != std::string::npos) {
        schema_ = table_name.substr(0, dot_pos);
        table_name_ = table_name.substr(dot_pos + 1);
    } else {
        schema_.clear();
        table_name_ = table_name;
    }

    columns_ = columns;
    row_count_ = 0;
    buffer_.str("");
    buffer_.clear();
}

std::string BulkCopy::quote_identifier(const std::string& id) {
    std::string out;
    out.reserve(id.size() + 2);
    out.push_back('"');
    for (char c : id) {
        if (c == '"') out.append("\"\"");
        else out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string BulkCopy::full_table_name() const {
    if (schema_.empty()) {
        return quote_identifier(table_name_);
    }
    return quote_identifier(schema_) + "." + quote_identifier(table_name_);
}

void BulkCopy::escape_value_into_buffer(const std::string& value) {
    for (char c : value) {
        if (c == '\0') continue;
        switch (c) {
            case '\\': buffer_ << "\\\\"; break;
            case '\t': buffer_ << "\\t";  break;
            case '\n': buffer_ << "\\n";  break;
            case '\r': buffer_ << "\\r";  break;
            default:   buffer_ << c;      break;
        }
    }
}

void BulkCopy::start_copy_if_needed() {
    if (in_copy_) return;

    if (columns_.empty()) {
        throw StorageError("BulkCopy: columns not set. Call begin_table() first.");
    }

    std::ostringstream copy_sql;
    copy_sql << "COPY " << full_table_name() << " (";
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (i) copy_sql << ", ";
        copy_sql << quote_identifier(columns_[i]);
    }
    copy_sql << ") FROM STDIN";

    db_.execute(copy_sql.str());
    in_copy_ = true;
}

void BulkCopy::send_buffer() {
    std::string data = buffer_.str();
    if (!data.empty()) {
        db_.copy_data(data.c_str(), static_cast<int>(data.size()));
    }
    buffer_.str("");
    buffer_.clear();
}

void BulkCopy::add_row(const std::vector<Value>& values) {
    start_copy_if_needed();

    const size_t ncols = columns_.size();
    for (size_t i = 0; i < ncols; ++i) {
        if (i) buffer_ << '\t';
        if (i < values.size() && values[i]) {
            escape_value_into_buffer(*values[i]);
        } else {
            buffer_ << "\\N";
        }
    }
    buffer_ << '\n';
    ++row_count_;

    if ((row_count_ % DEFAULT_FLUSH_ROWS) == 0) {
        send_buffer();
    }
}

void BulkCopy::flush() {
    if (!in_copy_) return;

    send_buffer();
    in_copy_ = false;
    db_.copy_end(nullptr);
    row_count_ = 0;
}

} // namespace ChainReplay
