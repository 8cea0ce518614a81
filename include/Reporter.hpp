#pragma once

#include <string>
#include <vector>

class Reporter
{
public:
    virtual ~Reporter() = default;

    virtual bool Send(const std::string& Subject, const std::string& Body) = 0;

    const std::string& GetLastError() const { return LastError; }

protected:
    std::string LastError;
};

// Plain-text mail through an SMTP relay
class MailReporter : public Reporter
{
public:
    MailReporter(std::string MailServer, std::string Sender, std::vector<std::string> Receivers);

    bool Send(const std::string& Subject, const std::string& Body) override;

    // RFC 5322 message with headers, exposed for logging and tests
    std::string BuildMessage(const std::string& Subject, const std::string& Body) const;

    std::string RelayUrl() const;

private:
    std::string MailServer;
    std::string Sender;
    std::vector<std::string> Receivers;
};
