#ifndef SESSION_REPORTER_HPP
#define SESSION_REPORTER_HPP

#include <cstddef>
#include <string>

/**
 * SessionReporter - User visible side of a session
 *
 * Sessions never print directly; everything the user should see goes
 * through one of these callbacks.
 */
class SessionReporter {
public:
    virtual ~SessionReporter() = default;

    virtual void onStatus(const std::string& message) = 0;
    virtual void onListingHeader(const std::string& host) = 0;
    virtual void onListingEntry(const std::string& name) = 0;
    virtual void onTransferComplete(const std::string& filename, size_t bytes) = 0;

    /** Negotiation, local and transport failures */
    virtual void onError(const std::string& message) = 0;

    /** ERROR notifications collected while draining the control connection */
    virtual void onServerError(const std::string& message) = 0;
};


class ConsoleReporter : public SessionReporter {
public:
    void onStatus(const std::string& message) override;
    void onListingHeader(const std::string& host) override;
    void onListingEntry(const std::string& name) override;
    void onTransferComplete(const std::string& filename, size_t bytes) override;
    void onError(const std::string& message) override;
    void onServerError(const std::string& message) override;
};

#endif // SESSION_REPORTER_HPP
