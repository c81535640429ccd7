#pragma once

#include <citestream/core/types.h>
#include <citestream/vector/embedding_provider.h>
#include <citestream/vector/vector_index.h>

#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>

namespace citestream::vector {

struct CorpusLoadStats {
    size_t loaded = 0;
    size_t skipped = 0; ///< Malformed lines or records without text
};

/**
 * Read passages from JSON Lines and upsert them into `index` under `ns`.
 *
 * One object per line:
 *   {"id", "session_id", "text", "document_id", "document_name", "page_number",
 *    "section_heading"}
 * Only "text" is required. Scalar fields are stored as string attributes; records
 * without an id get "passage-<line>". Blank lines are ignored.
 */
Result<CorpusLoadStats> loadCorpus(std::istream& in, IEmbeddingProvider& provider,
                                   IVectorIndex& index, const std::string& ns = "documents");

Result<CorpusLoadStats> loadCorpusJsonl(const std::filesystem::path& path,
                                        IEmbeddingProvider& provider, IVectorIndex& index,
                                        const std::string& ns = "documents");

} // namespace citestream::vector
