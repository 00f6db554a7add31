#include "TldRegistry.hpp"
#include "Utils.hpp"
#include <set>

// IANA root zone, https://data.iana.org/TLD/tlds-alpha-by-domain.txt
static const std::set<std::string> &registry() {
    static const std::set<std::string> tlds = {
        // generic, sponsored and infrastructure
        "abbott", "academy", "accountant", "accountants", "actor", "adult",
        "aero", "africa", "agency", "airforce", "amazon", "android",
        "apartments", "app", "apple", "archi", "army", "arpa", "art", "asia",
        "associates", "attorney", "auction", "audio", "auto", "autos", "baby",
        "band", "bank", "bar", "barcelona", "bargains", "beer", "berlin",
        "best", "bet", "bible", "bid", "bike", "bingo", "bio", "biz", "black",
        "blackfriday", "blog", "blue", "boats", "bond", "boo", "book",
        "boston", "boutique", "box", "broker", "build", "builders", "business",
        "buzz", "cab", "cafe", "cam", "camera", "camp", "capital", "car",
        "cards", "care", "career", "careers", "cars", "casa", "cash", "casino",
        "cat", "catering", "center", "ceo", "charity", "chat", "cheap",
        "church", "city", "claims", "cleaning", "click", "clinic", "clothing",
        "cloud", "club", "coach", "codes", "coffee", "college", "com",
        "community", "company", "computer", "condos", "construction",
        "consulting", "contractors", "cooking", "cool", "coop", "country",
        "coupons", "courses", "credit", "creditcard", "cricket", "cruises",
        "cyou", "dad", "dance", "date", "dating", "day", "deals", "degree",
        "delivery", "democrat", "dental", "dentist", "design", "dev",
        "diamonds", "diet", "digital", "direct", "directory", "discount",
        "doctor", "dog", "domains", "download", "earth", "eco", "edu",
        "education", "email", "energy", "engineer", "engineering",
        "enterprises", "equipment", "estate", "events", "exchange", "expert",
        "exposed", "express", "fail", "faith", "family", "fan", "fans", "farm",
        "fashion", "film", "finance", "financial", "fish", "fit", "fitness",
        "flights", "florist", "football", "forsale", "foundation", "free",
        "fun", "fund", "furniture", "futbol", "fyi", "gallery", "game",
        "games", "garden", "gay", "gift", "gifts", "gives", "glass", "global",
        "gmbh", "gold", "golf", "google", "gov", "graphics", "gratis", "green",
        "gripe", "group", "guide", "guitars", "guru", "hamburg", "haus",
        "health", "healthcare", "help", "hiphop", "hockey", "holdings",
        "holiday", "homes", "horse", "hospital", "host", "hosting", "house",
        "how", "icu", "immo", "inc", "industries", "info", "ink", "institute",
        "insure", "int", "international", "investments", "irish", "jetzt",
        "jewelry", "jobs", "kim", "kitchen", "kiwi", "land", "lat", "law",
        "lawyer", "lease", "legal", "lgbt", "life", "lighting", "limited",
        "limo", "link", "live", "llc", "loan", "loans", "lol", "london",
        "love", "ltd", "luxury", "maison", "management", "market", "marketing",
        "mba", "media", "memorial", "men", "menu", "miami", "mil", "mobi",
        "moda", "moe", "mom", "money", "monster", "mortgage", "motorcycles",
        "mov", "movie", "museum", "music", "name", "navy", "net", "network",
        "new", "news", "nexus", "ninja", "nyc", "one", "online", "ooo", "org",
        "organic", "page", "paris", "partners", "parts", "party", "pet", "phd",
        "photo", "photography", "photos", "pics", "pictures", "pink", "pizza",
        "place", "plumbing", "plus", "poker", "porn", "post", "press", "pro",
        "productions", "promo", "properties", "property", "pub", "quest",
        "racing", "radio", "realestate", "realty", "recipes", "red", "rehab",
        "reise", "reisen", "rent", "rentals", "repair", "report", "republican",
        "rest", "restaurant", "review", "reviews", "rich", "rip", "rocks",
        "rodeo", "run", "sale", "salon", "sarl", "school", "schule", "science",
        "security", "services", "sex", "sexy", "shiksha", "shoes", "shop",
        "shopping", "show", "singles", "site", "ski", "soccer", "social",
        "software", "solar", "solutions", "space", "store", "stream", "studio",
        "study", "style", "sucks", "supplies", "supply", "support", "surf",
        "surgery", "sydney", "systems", "tattoo", "tax", "taxi", "team",
        "tech", "technology", "tel", "tennis", "theater", "tickets", "tienda",
        "tips", "tires", "today", "tokyo", "tools", "top", "tours", "town",
        "toys", "trade", "training", "travel", "tube", "university", "uno",
        "vacations", "vegas", "ventures", "vet", "viajes", "video", "villas",
        "vin", "vip", "vision", "vodka", "vote", "voting", "voto", "voyage",
        "wales", "wang", "watch", "webcam", "website", "wedding", "wiki",
        "win", "wine", "work", "works", "world", "wtf", "xxx", "xyz", "yoga",
        "zone",
        // country code
        "ac", "ad", "ae", "af", "ag", "ai", "al", "am", "ao", "aq", "ar", "as",
        "at", "au", "aw", "ax", "az", "ba", "bb", "bd", "be", "bf", "bg", "bh",
        "bi", "bj", "bm", "bn", "bo", "bq", "br", "bs", "bt", "bw", "by", "bz",
        "ca", "cc", "cd", "cf", "cg", "ch", "ci", "ck", "cl", "cm", "cn", "co",
        "cr", "cu", "cv", "cw", "cx", "cy", "cz", "de", "dj", "dk", "dm", "do",
        "dz", "ec", "ee", "eg", "er", "es", "et", "eu", "fi", "fj", "fk", "fm",
        "fo", "fr", "ga", "gb", "gd", "ge", "gf", "gg", "gh", "gi", "gl", "gm",
        "gn", "gp", "gq", "gr", "gs", "gt", "gu", "gw", "gy", "hk", "hm", "hn",
        "hr", "ht", "hu", "id", "ie", "il", "im", "in", "io", "iq", "ir", "is",
        "it", "je", "jm", "jo", "jp", "ke", "kg", "kh", "ki", "km", "kn", "kp",
        "kr", "kw", "ky", "kz", "la", "lb", "lc", "li", "lk", "lr", "ls", "lt",
        "lu", "lv", "ly", "ma", "mc", "md", "me", "mg", "mh", "mk", "ml", "mm",
        "mn", "mo", "mp", "mq", "mr", "ms", "mt", "mu", "mv", "mw", "mx", "my",
        "mz", "na", "nc", "ne", "nf", "ng", "ni", "nl", "no", "np", "nr", "nu",
        "nz", "om", "pa", "pe", "pf", "pg", "ph", "pk", "pl", "pm", "pn", "pr",
        "ps", "pt", "pw", "py", "qa", "re", "ro", "rs", "ru", "rw", "sa", "sb",
        "sc", "sd", "se", "sg", "sh", "si", "sj", "sk", "sl", "sm", "sn", "so",
        "sr", "ss", "st", "su", "sv", "sx", "sy", "sz", "tc", "td", "tf", "tg",
        "th", "tj", "tk", "tl", "tm", "tn", "to", "tr", "tt", "tv", "tw", "tz",
        "ua", "ug", "uk", "us", "uy", "uz", "va", "vc", "ve", "vg", "vi", "vn",
        "vu", "wf", "ws", "ye", "yt", "za", "zm", "zw",
    };
    return tlds;
}

bool TldRegistry::contains(const std::string &label) {
    if (label.empty()) return false;
    return registry().count(toLower(label)) > 0;
}

size_t TldRegistry::size() {
    return registry().size();
}
