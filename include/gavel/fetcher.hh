/**
 * @file fetcher.hh
 * @brief Byte transport used by the software decoder
 * @ingroup sources
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include <gavel/export_gavel.h>

namespace gavel {
    class event_loop;

    /**
     * @struct fetch_response
     * @brief Outcome of a fetch, modeled on an HTTP status
     */
    struct fetch_response {
        int status = 0;
        std::vector <uint8_t> body;

        [[nodiscard]] bool ok() const noexcept {
            return status >= 200 && status < 300;
        }
    };

    /**
     * @class fetcher
     * @brief Asynchronous "uri in, bytes out" transport
     *
     * Network transport belongs to the embedding application; it plugs in
     * by implementing this interface. The completion must run on the event
     * loop that drives the software decoder, and must run exactly once.
     */
    class GAVEL_EXPORT fetcher {
        public:
            using completion_t = std::function <void(fetch_response)>;

            virtual ~fetcher() = default;

            virtual void fetch(const std::string& uri, completion_t done) = 0;
    };

    /**
     * @class file_fetcher
     * @brief Serves local assets and file:// URIs
     *
     * Relative paths are resolved against the asset root. A missing file
     * answers 404, a URI with any scheme other than file:// answers 400.
     */
    class GAVEL_EXPORT file_fetcher : public fetcher {
        public:
            file_fetcher(event_loop& loop, std::string asset_root);

            void fetch(const std::string& uri, completion_t done) override;

            /**
             * @brief Map a URI to the path that will be opened
             * @return Empty string if the URI is not a local one
             */
            [[nodiscard]] std::string resolve(const std::string& uri) const;

        private:
            event_loop& m_loop;
            std::string m_asset_root;
    };
}
