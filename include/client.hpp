/*
* @license
* (C) zachbabanov
*
*/

#ifndef HPLAYER_CLIENT_HPP
#define HPLAYER_CLIENT_HPP

#pragma once

#include <common.hpp>

#include <string>

#include <nlohmann/json.hpp>

namespace hplayer {
    namespace client {

        /**
         * @brief Blocking client for the hplayerd control protocol (one JSON object per line).
         */
        class Client {
        public:
            Client(const std::string &host, int port, int timeoutMs = 15000);
            ~Client();

            bool connect();
            void close();

            /// Send one request and read one reply line.
            bool request(const nlohmann::json &req, nlohmann::json &reply);

            /**
             * @brief Stream a local file as an "upload" request.
             * @param remoteName name to store it under; empty = basename of @p localPath
             */
            bool upload(const std::string &localPath, const std::string &remoteName, nlohmann::json &reply);

            const std::string &lastError() const { return error_; }

        private:
            bool readLine(std::string &line);

        private:
            std::string host_;
            int port_;
            int timeoutMs_;
            hplayer::common::sock_t sock_;
            std::string inBuffer_;
            std::string error_;
        };

    } // namespace client
} // namespace hplayer

#endif // HPLAYER_CLIENT_HPP
