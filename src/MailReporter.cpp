#include "Reporter.hpp"
#include "Logger.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cstring>
#include <ctime>
#include <utility>

namespace
{
    struct UploadState
    {
        const std::string* Payload;
        size_t Offset;
    };

    size_t ReadPayload(char* Buffer, size_t Size, size_t Count, void* UserData)
    {
        UploadState* State = static_cast<UploadState*>(UserData);
        size_t Room = Size * Count;
        if (Room == 0 || State->Offset >= State->Payload->size())
        {
            return 0;
        }

        size_t Chunk = std::min(Room, State->Payload->size() - State->Offset);
        std::memcpy(Buffer, State->Payload->data() + State->Offset, Chunk);
        State->Offset += Chunk;
        return Chunk;
    }

    // SMTP wants CRLF line endings
    std::string ToCrlf(const std::string& Text)
    {
        std::string Out;
        Out.reserve(Text.size() + Text.size() / 16);
        for (char Ch : Text)
        {
            if (Ch == '\n')
            {
                Out += "\r\n";
            }
            else if (Ch != '\r')
            {
                Out += Ch;
            }
        }
        return Out;
    }

    std::string MailDate()
    {
        std::time_t Now = std::time(nullptr);
        std::tm Local{};
        localtime_r(&Now, &Local);

        char Buffer[64];
        std::strftime(Buffer, sizeof(Buffer), "%a, %d %b %Y %H:%M:%S %z", &Local);
        return Buffer;
    }
}

MailReporter::MailReporter(std::string Server, std::string From, std::vector<std::string> To)
    : MailServer(std::move(Server)), Sender(std::move(From)), Receivers(std::move(To))
{
}

std::string MailReporter::RelayUrl() const
{
    if (MailServer.find("://") != std::string::npos)
    {
        return MailServer;
    }
    return "smtp://" + MailServer;
}

std::string MailReporter::BuildMessage(const std::string& Subject, const std::string& Body) const
{
    std::string To;
    for (size_t i = 0; i < Receivers.size(); ++i)
    {
        if (i > 0)
        {
            To += ", ";
        }
        To += Receivers[i];
    }

    std::string Message;
    Message += "Date: " + MailDate() + "\r\n";
    Message += "From: " + Sender + "\r\n";
    Message += "To: " + To + "\r\n";
    Message += "Subject: " + Subject + "\r\n";
    Message += "MIME-Version: 1.0\r\n";
    Message += "Content-Type: text/plain; charset=utf-8\r\n";
    Message += "\r\n";
    Message += ToCrlf(Body);
    Message += "\r\n";
    return Message;
}

bool MailReporter::Send(const std::string& Subject, const std::string& Body)
{
    LastError.clear();

    const std::string Message = BuildMessage(Subject, Body);
    UploadState State{ &Message, 0 };

    CURL* Curl = curl_easy_init();
    if (!Curl)
    {
        LastError = "Could not initialise the mail client";
        return false;
    }

    struct curl_slist* Recipients = nullptr;
    for (const auto& Receiver : Receivers)
    {
        Recipients = curl_slist_append(Recipients, ("<" + Receiver + ">").c_str());
    }

    const std::string Url = RelayUrl();
    const std::string From = "<" + Sender + ">";

    curl_easy_setopt(Curl, CURLOPT_URL, Url.c_str());
    curl_easy_setopt(Curl, CURLOPT_MAIL_FROM, From.c_str());
    curl_easy_setopt(Curl, CURLOPT_MAIL_RCPT, Recipients);
    curl_easy_setopt(Curl, CURLOPT_READFUNCTION, ReadPayload);
    curl_easy_setopt(Curl, CURLOPT_READDATA, &State);
    curl_easy_setopt(Curl, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(Curl, CURLOPT_VERBOSE, Log.GetLevel() == LogLevel::DEBUG ? 1L : 0L);

    Log.Debug("[MailReporter] Sending report through " + Url);
    CURLcode Result = curl_easy_perform(Curl);
    if (Result != CURLE_OK)
    {
        LastError = std::string("There was a error and the email was not sent:\n") + curl_easy_strerror(Result);
    }

    curl_slist_free_all(Recipients);
    curl_easy_cleanup(Curl);

    return Result == CURLE_OK;
}
