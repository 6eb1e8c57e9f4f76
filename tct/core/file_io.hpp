#pragma once

#include <cstdio>
#include <string>
#include <optional>
#include <string_view>

#include "log.hpp"
#include "panic.hpp"


namespace tct::io {


inline std::optional<std::string> read_text_file(const char* file_path, log::LogCategory category)
{
	TCT_ASSERT_MSG(file_path, "file_path == null");

	FILE* file_handle = std::fopen(file_path, "rb");
	if (!file_handle) {
		TCT_ERROR(
			category,
			"[file_io][read_text_file] fopen fail [path %s]",
			file_path
		);
		return std::nullopt;
	}
	if (std::fseek(file_handle, 0, SEEK_END) != 0) {
		TCT_ERROR(
			category,
			"[file_io][read_text_file] fseek end fail [path %s]",
			file_path
		);
		std::fclose(file_handle);
		return std::nullopt;
	}
	long file_size_signed = std::ftell(file_handle);
	if (file_size_signed < 0) {
		TCT_ERROR(
			category,
			"[file_io][read_text_file] ftell fail [path %s]",
			file_path
		);
		std::fclose(file_handle);
		return std::nullopt;
	}
	if (std::fseek(file_handle, 0, SEEK_SET) != 0) {
		TCT_ERROR(
			category,
			"[file_io][read_text_file] fseek set fail [path %s]",
			file_path
		);
		std::fclose(file_handle);
		return std::nullopt;
	}

	size_t file_size = static_cast<size_t>(file_size_signed);
	std::string data;
	data.resize(file_size);

	size_t bytes_read = std::fread(data.data(), 1, file_size, file_handle);
	std::fclose(file_handle);

	if (bytes_read != file_size) {
		TCT_ERROR(
			category,
			"[file_io][read_text_file] fread short [path %s][bytes_read %zu][file_size %zu]",
			file_path,
			bytes_read,
			file_size
		);
		return std::nullopt;
	}

	TCT_DEBUG(
		category,
		"[file_io][read_text_file] ok [path %s][bytes %zu]",
		file_path,
		file_size
	);

	return data;
}


inline bool write_text_file(const char* file_path, std::string_view text, log::LogCategory category)
{
	TCT_ASSERT_MSG(file_path, "file_path == null");

	FILE* file_handle = std::fopen(file_path, "wb");
	if (!file_handle) {
		TCT_ERROR(
			category,
			"[file_io][write_text_file] fopen fail [path %s]",
			file_path
		);
		return false;
	}

	size_t bytes_written = std::fwrite(text.data(), 1, text.size(), file_handle);
	const bool is_closed = std::fclose(file_handle) == 0;

	if (bytes_written != text.size() || !is_closed) {
		TCT_ERROR(
			category,
			"[file_io][write_text_file] fwrite short [path %s][bytes_written %zu][size %zu]",
			file_path,
			bytes_written,
			text.size()
		);
		return false;
	}

	TCT_DEBUG(
		category,
		"[file_io][write_text_file] ok [path %s][bytes %zu]",
		file_path,
		text.size()
	);

	return true;
}

} // tct::io
