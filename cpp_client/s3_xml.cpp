#include "s3_xml.hpp"
#include "transfer_errors.hpp"
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace {
using XmlDoc = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;
using XmlBuffer = std::unique_ptr<xmlBuffer, decltype(&xmlBufferFree)>;

const xmlChar* ToXml(const char* text) {
    return reinterpret_cast<const xmlChar*>(text);
}

// Workers parse error bodies concurrently; libxml2 wants one initialisation first.
void EnsureParserInitialized() {
    static std::once_flag once;
    std::call_once(once, [] { xmlInitParser(); });
}

XmlDoc ReadDocument(const std::string& body) {
    EnsureParserInitialized();
    if (body.empty()) {
        return XmlDoc(nullptr, xmlFreeDoc);
    }
    return XmlDoc(xmlReadMemory(body.data(), static_cast<int>(body.size()), "s3.xml", nullptr,
                                XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING),
                  xmlFreeDoc);
}

std::string LastParseError() {
    const xmlError* error = xmlGetLastError();
    if (error == nullptr || error->message == nullptr) return "malformed XML";
    std::string message = error->message;
    while (!message.empty() && (message.back() == '\n' || message.back() == ' ')) {
        message.pop_back();
    }
    return message;
}

bool IsElement(const xmlNode* node, const char* name) {
    return node != nullptr && node->type == XML_ELEMENT_NODE && xmlStrcmp(node->name, ToXml(name)) == 0;
}

const xmlNode* Root(const XmlDoc& doc, const char* name) {
    if (!doc) return nullptr;
    const xmlNode* root = xmlDocGetRootElement(doc.get());
    return IsElement(root, name) ? root : nullptr;
}

const xmlNode* Child(const xmlNode* parent, const char* name) {
    for (const xmlNode* cur = parent->children; cur != nullptr; cur = cur->next) {
        if (IsElement(cur, name)) return cur;
    }
    return nullptr;
}

// Decoded text of the named child element; empty if absent.
std::string ChildText(const xmlNode* parent, const char* name) {
    const xmlNode* child = Child(parent, name);
    if (child == nullptr) return "";

    std::unique_ptr<xmlChar, void (*)(void*)> content(xmlNodeGetContent(child), [](void* p) { xmlFree(p); });
    if (!content) return "";
    return reinterpret_cast<const char*>(content.get());
}
} // namespace

std::string TrimETag(const std::string& etag) {
    size_t first = etag.find_first_not_of("\" ");
    if (first == std::string::npos) return "";
    size_t last = etag.find_last_not_of("\" ");
    return etag.substr(first, last - first + 1);
}

InitiateMultipartUploadResult ParseInitiateMultipartUpload(const std::string& body) {
    XmlDoc doc = ReadDocument(body);
    if (!doc) {
        throw ProtocolError("Unparseable CreateMultipartUpload response: " + LastParseError());
    }
    const xmlNode* root = Root(doc, "InitiateMultipartUploadResult");
    if (root == nullptr) {
        throw ProtocolError("Unexpected CreateMultipartUpload response body");
    }

    InitiateMultipartUploadResult result;
    result.bucket = ChildText(root, "Bucket");
    result.key = ChildText(root, "Key");
    result.upload_id = ChildText(root, "UploadId");
    if (result.upload_id.empty()) {
        throw ProtocolError("CreateMultipartUpload response is missing UploadId");
    }
    return result;
}

CompleteMultipartUploadResult ParseCompleteMultipartUpload(const std::string& body) {
    // S3 may answer 200 and still report failure in an <Error> document.
    if (auto error = ParseErrorDocument(body)) {
        throw ProtocolError("CompleteMultipartUpload failed: " + error->code + ": " + error->message, 200,
                            error->code);
    }

    XmlDoc doc = ReadDocument(body);
    if (!doc) {
        throw ProtocolError("Unparseable CompleteMultipartUpload response: " + LastParseError());
    }
    const xmlNode* root = Root(doc, "CompleteMultipartUploadResult");
    if (root == nullptr) {
        throw ProtocolError("Unexpected CompleteMultipartUpload response body");
    }

    CompleteMultipartUploadResult result;
    result.location = ChildText(root, "Location");
    result.bucket = ChildText(root, "Bucket");
    result.key = ChildText(root, "Key");
    result.etag = TrimETag(ChildText(root, "ETag"));
    return result;
}

std::optional<S3ErrorDocument> ParseErrorDocument(const std::string& body) {
    XmlDoc doc = ReadDocument(body);
    const xmlNode* root = Root(doc, "Error");
    if (root == nullptr) {
        return std::nullopt;
    }

    S3ErrorDocument error;
    error.code = ChildText(root, "Code");
    error.message = ChildText(root, "Message");
    error.resource = ChildText(root, "Resource");
    error.request_id = ChildText(root, "RequestId");
    return error;
}

std::string BuildCompleteMultipartUploadXml(const std::vector<PartResult>& parts) {
    if (parts.empty()) {
        throw ValidationError("CompleteMultipartUpload requires at least one part");
    }

    EnsureParserInitialized();
    XmlDoc doc(xmlNewDoc(ToXml("1.0")), xmlFreeDoc);
    xmlNodePtr root = xmlNewDocNode(doc.get(), nullptr, ToXml("CompleteMultipartUpload"), nullptr);
    xmlDocSetRootElement(doc.get(), root);

    int previous = 0;
    for (const auto& part : parts) {
        if (part.part_number <= previous) {
            throw ValidationError("Parts must be strictly ascending by part number");
        }
        previous = part.part_number;

        xmlNodePtr node = xmlNewChild(root, nullptr, ToXml("Part"), nullptr);
        xmlNewTextChild(node, nullptr, ToXml("PartNumber"), ToXml(std::to_string(part.part_number).c_str()));
        xmlNewTextChild(node, nullptr, ToXml("ETag"), ToXml(("\"" + part.etag + "\"").c_str()));
    }

    XmlBuffer buffer(xmlBufferCreate(), xmlBufferFree);
    if (!buffer || xmlNodeDump(buffer.get(), doc.get(), root, 0, 0) < 0) {
        throw std::runtime_error("Failed to serialise CompleteMultipartUpload body");
    }
    return reinterpret_cast<const char*>(xmlBufferContent(buffer.get()));
}

std::vector<PartResult> ParseCompleteMultipartUploadRequest(const std::string& body) {
    XmlDoc doc = ReadDocument(body);
    const xmlNode* root = Root(doc, "CompleteMultipartUpload");
    if (root == nullptr) {
        throw ProtocolError("Malformed CompleteMultipartUpload request body");
    }

    std::vector<PartResult> parts;
    for (const xmlNode* cur = root->children; cur != nullptr; cur = cur->next) {
        if (!IsElement(cur, "Part")) continue;

        PartResult part;
        try {
            part.part_number = std::stoi(ChildText(cur, "PartNumber"));
        } catch (const std::logic_error&) {
            throw ProtocolError("CompleteMultipartUpload part has no valid PartNumber");
        }
        part.etag = TrimETag(ChildText(cur, "ETag"));
        parts.push_back(part);
    }
    return parts;
}
