#pragma once

#include <span>
#include <string>
#include <cstdint>
#include <optional>
#include <string_view>

#include "mtp_memory.hpp"

#include "story_data.hpp"


namespace tct::sty {


struct LevelId
{
	uint32_t value {UINT32_MAX};

	[[nodiscard]] bool valid() const
	{ return value != UINT32_MAX; }

	friend bool operator==(LevelId lhs, LevelId rhs)
	{ return lhs.value == rhs.value; }
};


/* dense ids in bottom-up story order, so a LevelId doubles as a frame index */
class LevelRegistry
{
public:

	using NameMap = decltype(mtp::make_unordered_map<std::string, uint32_t, mtp::default_set>());

public:

	void clear()
	{
		m_names.clear();
		m_index.clear();
	}

	// caller guarantees unique levels (the ledger validates before calling)
	void rebuild(std::span<const Story> stories)
	{
		clear();

		m_names.reserve(stories.size());
		m_index.reserve(stories.size());

		for (const Story& story : stories) {
			const uint32_t level_index = static_cast<uint32_t>(m_names.size());

			m_names.emplace_back(story.level);
			m_index[story.level] = level_index;
		}
	}

	[[nodiscard]] std::optional<LevelId> find(std::string_view level) const
	{
		auto it = m_index.find(std::string {level});
		if (it == m_index.end())
			return std::nullopt;

		return LevelId {it->second};
	}

	[[nodiscard]] std::string_view name(LevelId level_id) const
	{
		if (!level_id.valid() || level_id.value >= m_names.size())
			return {};

		return m_names[level_id.value];
	}

	[[nodiscard]] size_t size() const
	{
		return m_names.size();
	}

private:

	mtp::vault<std::string, mtp::default_set> m_names;

	NameMap m_index {mtp::make_unordered_map<std::string, uint32_t, mtp::default_set>()};
};


} // tct::sty
