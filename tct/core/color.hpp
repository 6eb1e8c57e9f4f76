#pragma once

#include <cstdint>
#include <functional>
#include <string_view>


namespace tct {


inline constexpr uint32_t rgb_mask = 0xFFFFFFu;


/* story display color for (level, position); injected so runs stay reproducible */
using ColorAssigner = std::function<uint32_t(std::string_view level, uint32_t story_index)>;


[[nodiscard]] inline ColorAssigner make_seeded_colors(uint64_t seed)
{
	return [seed](std::string_view level, uint32_t story_index) -> uint32_t
	{
		static constexpr uint64_t fnv1a_offset_basis = 14695981039346656037ULL;
		static constexpr uint64_t fnv1a_prime        = 1099511628211ULL;

		uint64_t fnv1a_hash = fnv1a_offset_basis ^ seed;

		for (char ch : level) {
			fnv1a_hash ^= static_cast<uint8_t>(ch);
			fnv1a_hash *= fnv1a_prime;
		}
		fnv1a_hash ^= story_index; fnv1a_hash *= fnv1a_prime;

		// fold the high bits in, the low byte alone repeats for short names
		fnv1a_hash ^= fnv1a_hash >> 29;

		return static_cast<uint32_t>(fnv1a_hash) & rgb_mask;
	};
}

} // tct
