/**
 * @file
 *
 * Implementation of the endpoint helpers.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "endpoint_settings.h"
#include "common_logger.h"

#include <Poco/Exception.h>
#include <Poco/Net/HTTPClientSession.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/HTTPSClientSession.h>
#include <Poco/Net/InvalidCertificateHandler.h>
#include <Poco/Net/SSLException.h>
#include <Poco/Net/SSLManager.h>
#include <Poco/Net/VerificationErrorArgs.h>
#include <Poco/Net/X509Certificate.h>
#include <Poco/Timespan.h>

COMMON_LOGGER();

namespace
{

const std::string PREFERRED_CIPHERS = "ALL:!ADH:!LOW:!EXP:!MD5:@STRENGTH";

class logging_certificate_handler : public Poco::Net::InvalidCertificateHandler
{
public:
	using Poco::Net::InvalidCertificateHandler::InvalidCertificateHandler;

	void onInvalidCertificate(const void* sender,
	                          Poco::Net::VerificationErrorArgs& error_cert) override
	{
		LOG_ERROR("Certificate verification failed: %s (%d), Issuer: %s, "
		          "Subject: %s, chain position %d",
		          error_cert.errorMessage().c_str(),
		          error_cert.errorNumber(),
		          error_cert.certificate().issuerName().c_str(),
		          error_cert.certificate().subjectName().c_str(),
		          error_cert.errorDepth());
	}
};

uint16_t port_of(const Poco::URI& uri)
{
	if (uri.getPort() != 0)
	{
		return uri.getPort();
	}
	return opamp::endpoint::is_secure(uri) ? 443 : 80;
}

} // end namespace

namespace opamp
{

bool endpoint_settings::operator==(const endpoint_settings& rhs) const
{
	return url == rhs.url &&
	       headers == rhs.headers &&
	       api_key == rhs.api_key &&
	       timeout_ms == rhs.timeout_ms &&
	       tls.verify_certificate == rhs.tls.verify_certificate &&
	       tls.ca_cert_file == rhs.tls.ca_cert_file &&
	       tls.client_cert_file == rhs.tls.client_cert_file &&
	       tls.client_key_file == rhs.tls.client_key_file;
}

namespace endpoint
{

bool is_secure(const Poco::URI& uri)
{
	return uri.getScheme() == "https" || uri.getScheme() == "wss";
}

Poco::Net::Context::Ptr build_ssl_context(const tls_settings& tls)
{
	const Poco::Net::Context::VerificationMode verification_mode =
	        tls.verify_certificate ? Poco::Net::Context::VERIFY_STRICT
	                               : Poco::Net::Context::VERIFY_NONE;

	Poco::Net::Context::Ptr context =
	    new Poco::Net::Context(Poco::Net::Context::CLIENT_USE,
	                           tls.client_key_file,
	                           tls.client_cert_file,
	                           "",
	                           verification_mode,
	                           9,
	                           tls.ca_cert_file.empty(),
	                           PREFERRED_CIPHERS);

	if (!tls.ca_cert_file.empty())
	{
		try
		{
			LOG_INFO("Loading CA certificate: %s", tls.ca_cert_file.c_str());
			Poco::Net::X509Certificate ca_cert(tls.ca_cert_file);
			context->addCertificateAuthority(ca_cert);
		}
		catch (const Poco::Net::SSLException& e)
		{
			LOG_ERROR("Unable to add CA certificate: %s", e.displayText().c_str());
		}
		catch (const Poco::IOException& e)
		{
			LOG_ERROR("Unable to read CA certificate: %s", e.displayText().c_str());
		}
	}

	if (tls.verify_certificate)
	{
		Poco::SharedPtr<Poco::Net::InvalidCertificateHandler> handler =
		        new logging_certificate_handler(false);
		Poco::Net::SSLManager::instance().initializeClient(nullptr, handler, context);
	}

	return context;
}

std::unique_ptr<Poco::Net::HTTPClientSession> create_session(const Poco::URI& uri,
                                                             const endpoint_settings& settings)
{
	std::unique_ptr<Poco::Net::HTTPClientSession> session;

	if (is_secure(uri))
	{
		session.reset(new Poco::Net::HTTPSClientSession(uri.getHost(),
		                                                port_of(uri),
		                                                build_ssl_context(settings.tls)));
	}
	else
	{
		session.reset(new Poco::Net::HTTPClientSession(uri.getHost(), port_of(uri)));
	}

	session->setTimeout(Poco::Timespan(static_cast<Poco::Timespan::TimeDiff>(settings.timeout_ms) * 1000));
	session->setKeepAlive(true);
	return session;
}

void decorate_request(Poco::Net::HTTPRequest& request, const endpoint_settings& settings)
{
	if (!settings.api_key.empty())
	{
		request.set("Authorization", "Secret-Key " + settings.api_key);
	}

	for (const auto& header : settings.headers)
	{
		request.set(header.first, header.second);
	}
}

std::string request_target(const Poco::URI& uri)
{
	std::string target = uri.getPathAndQuery();
	return target.empty() ? "/" : target;
}

} // namespace endpoint
} // namespace opamp
