// Dictionary used for transfer identifiers. Lowercase ASCII words only, no
// duplicates, so a joined identifier can be split back unambiguously.

#include "server/wordlist.hpp"

#include <array>

namespace xfer {

namespace {

constexpr std::array<std::string_view, 3033> kWords{{
    "abacus", "abandon", "abbey", "abdomen", "ability", "ablaze", "aboard", "abode", "abort",
    "abound", "abrasive", "abridge", "abroad", "abrupt", "absence", "absolute", "absorb",
    "absorbed", "abstract", "absurd", "abundant", "abuse", "abyss", "academy", "accent", "accept",
    "access", "accident", "acclaim", "accolade", "accord", "account", "accuracy", "accurate",
    "accuse", "acetone", "achieve", "acid", "acidic", "acorn", "acoustic", "acquire", "acre",
    "acrobat", "acronym", "across", "acrylic", "action", "activate", "active", "actor", "actress",
    "actual", "acumen", "adapt", "adder", "addict", "address", "adept", "adhesive", "adjacent",
    "adjust", "admiral", "admire", "admit", "adobe", "adopt", "adorable", "adore", "adorn",
    "adrift", "adult", "advance", "advanced", "advent", "adverb", "advice", "advise", "aerial",
    "aerobic", "affable", "affair", "affirm", "afford", "afloat", "afraid", "after", "aged",
    "agenda", "agent", "agile", "aging", "agony", "agree", "agreeable", "ahead", "aide", "aimless",
    "airbag", "airborne", "airfield", "airline", "airlock", "airmail", "airplane", "airport",
    "airship", "airspace", "airway", "airy", "aisle", "alarm", "albatross", "album", "alchemy",
    "alcove", "alder", "alert", "algae", "alias", "alibi", "alien", "align", "alike", "alive",
    "alkaline", "allergy", "alley", "alliance", "allot", "allow", "alloy", "almanac", "almond",
    "almost", "aloft", "alone", "along", "aloof", "alpaca", "alphabet", "alpine", "already",
    "also", "altar", "alter", "always", "amazing", "amber", "ambition", "amble", "ambush", "amend",
    "amenity", "amiable", "amid", "amino", "amnesty", "among", "amount", "ample", "amplify",
    "amulet", "amuse", "amused", "anchor", "ancient", "anecdote", "angel", "anger", "angle",
    "angry", "angular", "animal", "anise", "ankle", "annex", "announce", "annual", "anode",
    "anomaly", "answer", "antelope", "anthem", "anthill", "antique", "antler", "antsy", "anvil",
    "anxious", "anybody", "anyhow", "anyone", "anything", "anyway", "anywhere", "apart", "apathy",
    "aperture", "apex", "apiary", "apology", "apparel", "apparent", "appeal", "appear", "append",
    "appetite", "applause", "apple", "appliance", "apply", "apricot", "april", "apron", "aptitude",
    "aquarium", "aquatic", "aquifer", "arbor", "arcade", "arch", "archer", "archway", "arctic",
    "arena", "argue", "arid", "arise", "armada", "armadillo", "armband", "armchair", "armful",
    "armhole", "armor", "armpit", "army", "aroma", "around", "arrange", "array", "arrest",
    "arrival", "arrow", "arrowhead", "arsenal", "artery", "artful", "artichoke", "article",
    "artisan", "artist", "artistic", "artwork", "ascend", "ascent", "ashen", "ashtray", "aside",
    "aspect", "aspen", "asphalt", "aspire", "assault", "assemble", "assert", "asset", "assist",
    "assume", "assured", "aster", "asthma", "astound", "astral", "astute", "asylum", "athlete",
    "atlas", "atoll", "atom", "atomic", "atrium", "attach", "attempt", "attend", "attic", "attire",
    "attitude", "auburn", "auction", "audible", "audio", "audit", "august", "aunt", "aura",
    "austere", "author", "autumn", "avalanche", "avenue", "average", "avid", "avocado", "avoid",
    "awake", "award", "aware", "awesome", "awful", "awkward", "awning", "axis", "axle", "axolotl",
    "azalea", "babble", "baboon", "backbone", "backdrop", "backhand", "backpack", "backside",
    "backup", "backwater", "backyard", "bacon", "badge", "badger", "badland", "baffle", "bagel",
    "baggage", "bagpipe", "bakery", "balance", "balcony", "bald", "ballad", "ballet", "balloon",
    "ballot", "balmy", "balsam", "bamboo", "banana", "bandage", "bandit", "banjo", "banner",
    "banquet", "bantam", "barber", "barcode", "barefoot", "bargain", "barge", "baritone", "barley",
    "barn", "barnacle", "barnyard", "barometer", "baron", "barrel", "barren", "barrier", "basalt",
    "bashful", "basil", "basin", "basket", "bassoon", "batch", "bath", "baton", "battery",
    "battle", "bayberry", "bayou", "beach", "beachhead", "beacon", "beagle", "beak", "beam",
    "bean", "bear", "beard", "bearing", "beast", "beaver", "become", "bedrock", "bedroom",
    "beechnut", "beehive", "beetle", "beetroot", "before", "begin", "behave", "behind", "beige",
    "belfry", "belief", "bellflower", "bellow", "belly", "belong", "beloved", "below", "bench",
    "bend", "bendy", "benefit", "benign", "bergamot", "berry", "beside", "best", "betray",
    "better", "beyond", "bicycle", "bidder", "biggest", "bike", "billiard", "binder", "biology",
    "birch", "birdbath", "birdhouse", "birth", "biscuit", "bishop", "bison", "bitter", "blackbird",
    "blade", "blame", "bland", "blank", "blanket", "blast", "blaze", "blazing", "bleach", "bleak",
    "blend", "bless", "blimp", "blind", "blink", "bliss", "blissful", "blithe", "blizzard",
    "block", "blonde", "blossom", "blouse", "blower", "blue", "bluebell", "blueberry", "bluegrass",
    "bluff", "blunt", "blur", "blush", "board", "boardwalk", "boast", "boat", "bobcat", "bobsled",
    "body", "bogus", "boil", "boisterous", "bold", "bolster", "bolt", "bonfire", "bonnet",
    "bonsai", "bonus", "bony", "bookcase", "booklet", "bookmark", "boost", "booth", "border",
    "boring", "borrow", "bosom", "botany", "bottle", "bottom", "boulder", "bounce", "bouncy",
    "bouquet", "boxer", "boxwood", "bracelet", "bracket", "braid", "brain", "brainy", "brake",
    "bramble", "branch", "brand", "brass", "brave", "bread", "breadbox", "breaker", "breeze",
    "breezy", "briar", "brick", "bride", "bridge", "brief", "bright", "brilliant", "brim", "brine",
    "brisk", "brisket", "bristle", "brittle", "broad", "broccoli", "brochure", "broken", "bronze",
    "brook", "broom", "brother", "brown", "browse", "brunch", "brush", "bubble", "bubbly",
    "bucket", "buckle", "buckwheat", "budget", "buffalo", "buffet", "bugle", "build", "bulb",
    "bulk", "bulky", "bulldog", "bullet", "bullfrog", "bumblebee", "bumpy", "bundle", "bunker",
    "buoyant", "burden", "bureau", "burger", "burlap", "burly", "burrow", "bush", "bustle", "busy",
    "butter", "buttercup", "butterfly", "button", "buyer", "buzzard", "cabana", "cabbage", "cabin",
    "cable", "cactus", "cadet", "cafe", "cage", "cake", "calcium", "calendar", "calf", "call",
    "calm", "camel", "camellia", "cameo", "camera", "campfire", "campus", "canal", "canary",
    "candela", "candid", "candle", "candy", "cannon", "canoe", "canopy", "canteen", "canvas",
    "canyon", "capable", "cape", "capital", "capsule", "captain", "caption", "car", "caramel",
    "caravan", "carbon", "card", "cardinal", "carefree", "careful", "cargo", "caring", "carnation",
    "carnival", "carol", "carpet", "carrot", "carry", "cart", "carton", "cascade", "cashew",
    "cashmere", "casino", "castle", "casual", "catalog", "catch", "category", "catfish", "catnip",
    "cattle", "caught", "cauldron", "cause", "caution", "cautious", "cavalry", "cave", "caveman",
    "cedar", "ceiling", "celery", "celestial", "cellar", "cement", "census", "century", "cereal",
    "certain", "chalk", "chamomile", "champion", "change", "channel", "chaparral", "chapel",
    "chapter", "charcoal", "chariot", "charm", "charming", "chart", "chase", "cheap", "check",
    "cheek", "cheerful", "cheese", "cheetah", "chef", "cherry", "chess", "chest", "chestnut",
    "chicken", "chickpea", "chief", "child", "chilly", "chimney", "chipmunk", "chisel", "chive",
    "choice", "chorus", "chrome", "chubby", "chunk", "church", "cider", "cigar", "cinema",
    "cinnamon", "circle", "circus", "citizen", "citrus", "city", "civic", "civil", "claim", "clam",
    "clap", "clarify", "clarinet", "class", "classic", "clause", "claw", "clay", "clean",
    "clementine", "clerk", "clever", "click", "client", "cliff", "cliffside", "climb", "clinic",
    "clip", "clock", "clockwork", "closet", "cloth", "cloud", "cloudburst", "clover", "clown",
    "club", "clue", "clumsy", "cluster", "clutch", "coach", "coast", "coastal", "cobalt", "cobble",
    "cobbled", "cockatoo", "coconut", "code", "coffee", "collar", "collect", "color", "colossal",
    "column", "combat", "comet", "comfort", "comic", "comical", "common", "compact", "compass",
    "compost", "concert", "condor", "conduct", "cone", "confirm", "congress", "connect",
    "consider", "content", "control", "convince", "cook", "cool", "copper", "copperhead", "coral",
    "cordial", "core", "cormorant", "corn", "corner", "cornfield", "correct", "cosmic", "cottage",
    "cotton", "couch", "cougar", "country", "couple", "course", "cousin", "cover", "cowbell",
    "coyote", "cozy", "crab", "cradle", "craft", "crafty", "cranberry", "crane", "crater", "crawl",
    "crayon", "creaky", "cream", "creamy", "credit", "creek", "crescent", "crew", "cricket",
    "crime", "crimson", "crisp", "crispy", "critic", "crocus", "croissant", "crooked", "crop",
    "cross", "crossbow", "crouch", "crowbar", "crowd", "crucial", "cruise", "crumble", "crunch",
    "crunchy", "crystal", "cube", "cucumber", "cuddly", "culture", "cupboard", "cupcake", "cupola",
    "curious", "curly", "currant", "current", "curtain", "curve", "cushion", "custom", "cutlass",
    "cycle", "cymbal", "cypress", "daffodil", "dagger", "dahlia", "dainty", "daisy", "damage",
    "damp", "dance", "dandelion", "danger", "dapper", "daring", "dash", "dashing", "daughter",
    "dawn", "daybreak", "daylight", "dazzling", "debate", "debris", "decade", "december", "decent",
    "decide", "deckhand", "decline", "decorate", "decrease", "deer", "defense", "define", "deft",
    "degree", "delay", "deliver", "delta", "demand", "denim", "dense", "dentist", "deny", "depart",
    "depend", "deposit", "depth", "deputy", "derive", "describe", "desert", "design", "desk",
    "despair", "destroy", "detail", "detect", "develop", "device", "devote", "devout", "dewdrop",
    "dewy", "diagram", "dial", "diamond", "diary", "diesel", "diet", "differ", "digital",
    "dignity", "dilemma", "diligent", "dim", "dingo", "dinner", "dinosaur", "direct", "dirt",
    "disagree", "discover", "disease", "dish", "dismiss", "disorder", "display", "distance",
    "divert", "divide", "divorce", "dizzy", "doctor", "document", "dogwood", "dolphin", "domain",
    "donate", "donkey", "donor", "door", "doorbell", "doorway", "dose", "double", "dove", "draft",
    "dragon", "dragonfly", "drama", "drastic", "draw", "dream", "dreamy", "dress", "drift",
    "driftwood", "drill", "drink", "drip", "drive", "drizzle", "dromedary", "drop", "drum", "dry",
    "duck", "duckling", "dumb", "dumpling", "dune", "during", "dust", "dustpan", "dusty", "dutch",
    "duty", "dwarf", "dynamic", "eager", "eagle", "early", "earn", "earnest", "earth", "earthy",
    "easily", "east", "easy", "echo", "ecology", "economy", "edge", "edible", "edit", "educate",
    "effort", "eggplant", "eggshell", "eight", "either", "elastic", "elated", "elbow", "elder",
    "elderberry", "electric", "elegant", "element", "elephant", "elevator", "elite", "elm", "else",
    "embark", "embody", "embrace", "emerald", "emerge", "eminent", "emotion", "employ", "empower",
    "empty", "emu", "enable", "enact", "endless", "endorse", "enemy", "energetic", "energy",
    "enforce", "engage", "engine", "enhance", "enjoy", "enlist", "enough", "enrich", "enroll",
    "ensure", "enter", "entire", "entry", "envelope", "epic", "episode", "equal", "equator",
    "equip", "ermine", "erode", "erosion", "error", "erupt", "escape", "essay", "essence",
    "estate", "estuary", "eternal", "ethics", "eucalyptus", "even", "evergreen", "evidence",
    "evil", "evoke", "evolve", "exact", "example", "excess", "exchange", "excite", "exclude",
    "excuse", "execute", "exercise", "exhaust", "exhibit", "exile", "exist", "exit", "exotic",
    "expand", "expect", "expire", "explain", "expose", "express", "extend", "extra", "eyebrow",
    "fabric", "face", "faculty", "fade", "faded", "faint", "fair", "faith", "faithful", "falcon",
    "falconer", "false", "fame", "family", "famous", "fancy", "fantasy", "farm", "farmhouse",
    "fashion", "fatal", "father", "fatigue", "fault", "favorite", "fearless", "feature",
    "february", "federal", "feed", "feel", "feisty", "female", "fence", "fern", "ferret",
    "fertile", "festival", "festive", "fetch", "fever", "fiber", "fiction", "fiddle", "field",
    "fiery", "figure", "figurine", "file", "film", "filter", "filthy", "final", "finch", "find",
    "fine", "finger", "finish", "fire", "firefly", "fireplace", "firework", "firm", "fiscal",
    "fish", "fitness", "fjord", "flag", "flagpole", "flame", "flamingo", "flannel", "flapjack",
    "flash", "flat", "flavor", "flee", "flight", "flint", "flip", "float", "flock", "floodgate",
    "floor", "flower", "fluffy", "fluid", "flush", "flute", "foam", "focus", "fog", "foggy",
    "foghorn", "foil", "fold", "foliage", "follow", "fond", "food", "foot", "foothill", "footpath",
    "force", "forest", "forget", "fork", "forklift", "formal", "fortune", "forum", "forward",
    "fossil", "foster", "found", "fountain", "fox", "foxglove", "fragile", "fragrant", "frame",
    "frank", "frantic", "freckle", "freckled", "frequent", "fresh", "friend", "frigate", "fringe",
    "fritter", "frog", "front", "frost", "frostbite", "frosty", "frown", "frozen", "frugal",
    "fruit", "fuchsia", "fuel", "fungus", "funny", "furnace", "fury", "future", "fuzzy", "gable",
    "gadget", "gain", "galaxy", "gallant", "galleon", "gallery", "game", "gander", "gap", "garage",
    "garbage", "garden", "gardenia", "garlic", "garment", "garnet", "gasp", "gate", "gather",
    "gaudy", "gauge", "gaze", "gazelle", "gecko", "general", "genius", "genre", "gentle",
    "genuine", "gesture", "geyser", "ghost", "giant", "giddy", "gift", "gifted", "giggle",
    "gilded", "ginger", "giraffe", "girl", "give", "glacier", "glad", "gladiola", "glance",
    "glare", "glass", "gleaming", "glen", "glide", "glimpse", "globe", "gloom", "glory", "glossy",
    "glove", "glow", "glue", "goat", "goblet", "goddess", "gold", "golden", "goldfish", "gondola",
    "good", "goose", "gooseberry", "gopher", "gorilla", "gospel", "gossip", "gourd", "govern",
    "gown", "grab", "grace", "graceful", "grain", "grand", "granite", "grant", "grape",
    "grapefruit", "grass", "grassy", "grateful", "gravel", "gravity", "greasy", "great", "green",
    "grid", "griddle", "grief", "grit", "gritty", "grizzly", "grocery", "groovy", "grotto",
    "group", "grouse", "grow", "grumpy", "grunt", "guard", "guess", "guide", "guilt", "guitar",
    "gumdrop", "gutter", "gym", "habit", "hacksaw", "haddock", "hailstone", "hair", "hairy",
    "half", "halibut", "hammer", "hammock", "hamster", "hand", "handy", "happy", "harbor", "hard",
    "hardy", "harmless", "harmonica", "harp", "harpoon", "harsh", "harvest", "hasty", "hat",
    "hatchet", "have", "hawk", "haystack", "hazard", "hazelnut", "hazy", "head", "health",
    "healthy", "heart", "hearty", "heather", "heavenly", "heavy", "hedge", "hedgehog", "height",
    "hello", "helmet", "help", "helpful", "hen", "hero", "heroic", "heron", "herring", "hibiscus",
    "hickory", "hidden", "high", "highland", "hill", "hilltop", "hilly", "hint", "hip", "hippo",
    "hire", "history", "hoarse", "hobby", "hockey", "hold", "hole", "holiday", "hollow", "home",
    "homely", "homestead", "honest", "honey", "honeybee", "hood", "hope", "hopeful", "horn",
    "hornet", "horror", "horse", "horseshoe", "hospital", "host", "hotel", "hour", "hover", "hub",
    "huge", "human", "humane", "humble", "humid", "humor", "hundred", "hungry", "hunt", "hurdle",
    "hurry", "hurt", "husband", "hyacinth", "hybrid", "ice", "iceberg", "icon", "icy", "idea",
    "ideal", "identify", "idle", "igloo", "ignore", "iguana", "ill", "illegal", "illness", "image",
    "imitate", "immense", "immune", "impact", "impose", "improve", "impulse", "inch", "include",
    "income", "increase", "index", "indicate", "indigo", "indoor", "industry", "infant", "inflict",
    "inform", "inhale", "inherit", "initial", "inject", "injury", "inkwell", "inky", "inlet",
    "inmate", "inner", "innocent", "input", "inquiry", "insane", "insect", "inside", "inspire",
    "install", "intact", "interest", "into", "invest", "invite", "involve", "iris", "iron",
    "ironwood", "island", "islet", "isolate", "issue", "item", "ivory", "jackal", "jacket",
    "jagged", "jaguar", "jar", "jasmine", "jaunty", "javelin", "jazz", "jealous", "jeans", "jelly",
    "jellyfish", "jetty", "jewel", "job", "join", "joke", "jolly", "journey", "jovial", "joy",
    "joyful", "judge", "juice", "juicy", "jumbo", "jump", "jungle", "junior", "juniper", "junk",
    "just", "kangaroo", "kayak", "keen", "keep", "kelp", "kestrel", "ketchup", "kettle", "key",
    "keystone", "kick", "kidney", "kind", "kindly", "kingdom", "kingfisher", "kiss", "kitchen",
    "kite", "kitten", "kiwi", "knapsack", "knee", "knife", "knock", "knotty", "know", "koala",
    "label", "labor", "ladder", "lady", "lagoon", "lake", "lamp", "language", "lanky", "lantern",
    "laptop", "larch", "large", "lark", "lasso", "later", "latin", "lattice", "laugh", "laundry",
    "lava", "lavender", "lavish", "lawn", "lawsuit", "layer", "lazy", "leader", "leaf", "leafy",
    "lean", "learn", "leave", "lecture", "ledger", "left", "legal", "legend", "legible", "leisure",
    "lemon", "lemur", "lend", "length", "lens", "leopard", "lesson", "letter", "lettuce", "level",
    "liar", "liberty", "library", "license", "life", "lift", "light", "lighthouse", "like",
    "lilac", "lily", "limb", "limestone", "limit", "linden", "link", "lion", "liquid", "list",
    "little", "live", "lively", "lizard", "llama", "load", "loan", "lobster", "local", "lock",
    "locket", "locust", "lodge", "loft", "lofty", "logic", "lonely", "long", "loop", "lottery",
    "lotus", "loud", "lounge", "love", "loyal", "lucid", "lucky", "luggage", "lumber", "lumpy",
    "lunar", "lunch", "lush", "luxury", "lynx", "lyrics", "macaw", "machine", "mackerel", "magic",
    "magnet", "magnolia", "mahogany", "maid", "mail", "main", "majestic", "major", "make",
    "mallard", "mammal", "manage", "manatee", "mandate", "mandolin", "mango", "mangrove",
    "mansion", "mantis", "manual", "maple", "marble", "march", "margin", "marigold", "marine",
    "market", "marmot", "marriage", "marsh", "marten", "mask", "mass", "master", "match",
    "material", "math", "matrix", "matter", "maximum", "maze", "meadow", "mean", "measure", "meat",
    "mechanic", "medal", "media", "meerkat", "mellow", "melody", "melon", "melt", "member",
    "memory", "mention", "menu", "mercy", "merge", "merit", "merry", "mesh", "message", "metal",
    "meteor", "method", "middle", "midge", "midnight", "mighty", "mildew", "milk", "milky",
    "million", "millstone", "mimic", "mind", "minimum", "mink", "minnow", "minor", "minty",
    "minute", "miracle", "mirror", "misery", "miss", "mistake", "mistletoe", "misty", "mix",
    "mixed", "mixture", "mobile", "moccasin", "model", "modest", "modify", "moist", "molasses",
    "mole", "moment", "mongoose", "monitor", "monkey", "monster", "month", "moon", "moonbeam",
    "moose", "moral", "more", "morning", "mosaic", "mosquito", "moss", "mossy", "moth", "mother",
    "motion", "motor", "mountain", "mouse", "move", "movie", "much", "muddy", "muffin", "mulberry",
    "mule", "multiply", "murky", "muscle", "museum", "mushroom", "music", "musky", "mussel",
    "must", "mustang", "mustard", "mutual", "myself", "mystery", "mystic", "myth", "naive", "name",
    "napkin", "narrow", "narwhal", "nasty", "nation", "nature", "nautical", "near", "neat", "neck",
    "nectar", "need", "needy", "negative", "neglect", "neither", "nephew", "nerve", "nervous",
    "nest", "net", "network", "neutral", "never", "news", "next", "nice", "night", "nightowl",
    "nimble", "noble", "nocturnal", "noise", "noisy", "nominee", "noodle", "normal", "north",
    "nose", "notable", "note", "nothing", "notice", "novel", "now", "nuclear", "number", "nurse",
    "nut", "nutmeg", "nutty", "oak", "oatmeal", "obedient", "obey", "object", "oblige", "oblong",
    "obscure", "observe", "obtain", "obvious", "occur", "ocean", "ocelot", "october", "octopus",
    "odd", "odor", "offer", "office", "often", "oily", "olive", "olympic", "omit", "once", "onion",
    "online", "only", "open", "opera", "opinion", "oppose", "option", "orange", "orbit", "orchard",
    "orchid", "order", "orderly", "ordinary", "oregano", "organ", "organic", "orient", "original",
    "oriole", "ornate", "orphan", "osprey", "ostrich", "other", "otter", "outdoor", "outer",
    "outpost", "output", "outside", "oval", "oven", "over", "own", "owner", "oxygen", "oyster",
    "ozone", "pact", "paddle", "paddock", "page", "pagoda", "pair", "palace", "pale", "palm",
    "paltry", "pancake", "panda", "panel", "panic", "panther", "papaya", "paper", "paprika",
    "parade", "parent", "park", "parrot", "parsley", "parsnip", "party", "pass", "pasture",
    "patch", "path", "patient", "patrol", "pattern", "pause", "pave", "payment", "peace",
    "peaceful", "peach", "peacock", "peanut", "pear", "peasant", "pebble", "pecan", "pelican",
    "pen", "penalty", "pencil", "penguin", "peony", "people", "pepper", "peppermint", "peppy",
    "perfect", "periwinkle", "perky", "permit", "persimmon", "person", "pet", "petal", "petite",
    "pheasant", "phone", "photo", "phrase", "physical", "piano", "pickle", "picnic", "picture",
    "piece", "pig", "pigeon", "pill", "pilot", "pinecone", "pink", "pinwheel", "pioneer", "pipe",
    "pistachio", "pistol", "pitch", "pizza", "place", "placid", "plain", "planet", "plankton",
    "plastic", "plate", "platypus", "play", "playful", "pleasant", "please", "pledge", "pluck",
    "plucky", "plug", "plum", "plump", "plunge", "plush", "poem", "poet", "point", "polar", "pole",
    "police", "polite", "pond", "pony", "pool", "popular", "porcupine", "porpoise", "portion",
    "portly", "posh", "position", "possible", "post", "potato", "pottery", "poverty", "powder",
    "power", "practice", "prairie", "praise", "precise", "predict", "prefer", "prepare", "present",
    "pretty", "pretzel", "prevent", "price", "prickly", "pride", "prim", "primal", "primary",
    "primrose", "print", "priority", "prison", "private", "prize", "problem", "process", "produce",
    "profit", "program", "project", "promote", "proof", "proper", "property", "prosper", "protect",
    "proud", "provide", "prudent", "public", "pudding", "puffin", "puffy", "pull", "pulp", "pulse",
    "pumpkin", "punch", "pungent", "pupil", "puppy", "purchase", "purity", "purpose", "purse",
    "push", "puzzle", "pyramid", "quail", "quaint", "quality", "quantum", "quarry", "quarter",
    "quartz", "question", "quick", "quiet", "quill", "quince", "quirky", "quit", "quiz", "quote",
    "rabbit", "raccoon", "race", "rack", "radar", "radiant", "radio", "radish", "ragged", "rail",
    "rain", "rainbow", "rainy", "raise", "raisin", "rally", "rambler", "ramp", "ranch", "random",
    "range", "rapid", "rapids", "rare", "raspberry", "raspy", "rate", "rather", "rational",
    "rattle", "raven", "raw", "razor", "ready", "real", "reason", "rebel", "rebuild", "recall",
    "receive", "recipe", "record", "recycle", "reduce", "redwood", "reed", "reflect", "reform",
    "refuse", "regal", "region", "regret", "regular", "reindeer", "reject", "relax", "release",
    "relief", "rely", "remain", "remember", "remind", "remote", "remove", "render", "renew",
    "rent", "reopen", "repair", "repeat", "replace", "report", "require", "rescue", "resemble",
    "resist", "resource", "response", "result", "retire", "retreat", "return", "reunion", "reveal",
    "review", "reward", "rhubarb", "rhythm", "rib", "ribbon", "rice", "rich", "ride", "ridge",
    "rifle", "right", "rigid", "ring", "riot", "ripe", "ripple", "risk", "ritual", "rival",
    "river", "riverbank", "road", "roast", "robin", "robot", "robust", "rocket", "rocky",
    "romance", "roof", "rooftop", "rookie", "room", "rose", "rosemary", "rosy", "rotate", "rough",
    "round", "route", "rowdy", "royal", "rubber", "rude", "rug", "rugged", "rule", "run", "runway",
    "rural", "rustic", "rusty", "sad", "saddle", "sadness", "safe", "saffron", "sagebrush", "sail",
    "salad", "salamander", "salmon", "salon", "salt", "salty", "salute", "same", "sample", "sand",
    "sandbar", "sandpiper", "sandy", "sapphire", "sardine", "sassafras", "satisfy",
    "sauce", "sausage", "save", "savory", "say", "scale", "scallop", "scan", "scare", "scatter",
    "scene", "scenic", "scheme", "school", "science", "scissors", "scorpion", "scout", "scrap",
    "scrappy", "screen", "script", "scrub", "sea", "seagull", "seahorse", "search", "season",
    "seat", "second", "secret", "section", "security", "seed", "seek", "segment", "select", "sell",
    "seminar", "senior", "sense", "sentence", "sequoia", "serene", "series", "service", "session",
    "settle", "setup", "seven", "shadow", "shaft", "shaggy", "shallow", "shamrock", "share",
    "shed", "shell", "sheriff", "shield", "shift", "shine", "shiny", "ship", "shipyard", "shiver",
    "shock", "shoe", "shoot", "shop", "shoreline", "short", "shoulder", "shove", "shrimp", "shrug",
    "shuffle", "shy", "sibling", "sick", "side", "siege", "sight", "sign", "silent", "silk",
    "silky", "silly", "silver", "similar", "simple", "since", "sincere", "sing", "siren", "sister",
    "situate", "six", "size", "skate", "sketch", "ski", "skill", "skin", "skirt", "skull",
    "skylark", "skyline", "slab", "slam", "sleek", "sleep", "sleepy", "slender", "slice", "slide",
    "slight", "slim", "slogan", "slot", "slow", "slush", "small", "smart", "smile", "smoke",
    "smoky", "smooth", "snack", "snake", "snap", "snapdragon", "snappy", "sniff", "snow",
    "snowdrop", "snowflake", "snowy", "snug", "soap", "soccer", "social", "sock", "soda", "soft",
    "soggy", "solar", "soldier", "solemn", "solid", "solution", "solve", "someone", "song",
    "sonic", "soon", "sorrel", "sorry", "sort", "soul", "sound", "soup", "source", "south",
    "space", "spare", "sparkly", "sparrow", "spatial", "spawn", "speak", "spearmint", "special",
    "speed", "speedy", "spell", "spend", "sphere", "spice", "spicy", "spider", "spiffy", "spike",
    "spiky", "spin", "spinach", "spirit", "splendid", "split", "spoil", "sponsor", "spoon",
    "sport", "spot", "spotty", "spray", "spread", "spring", "spruce", "spry", "spy", "square",
    "squash", "squeaky", "squeeze", "squirrel", "stable", "stadium", "staff", "stage", "stairs",
    "stamp", "stand", "starfish", "stark", "starling", "start", "state", "stay", "steady", "steak",
    "steel", "steep", "stem", "step", "stereo", "stick", "sticky", "still", "sting", "stingray",
    "stock", "stocky", "stomach", "stone", "stool", "stork", "stormy", "story", "stove",
    "strategy", "strawberry", "street", "strike", "strong", "struggle", "student", "stuff",
    "stumble", "sturdy", "sturgeon", "style", "subject", "sublime", "submit", "subway", "success",
    "such", "sudden", "suffer", "sugar", "sugarcane", "sugary", "suggest", "suit", "summer", "sun",
    "sunflower", "sunlit", "sunny", "sunset", "super", "superb", "supply", "supreme", "sure",
    "surface", "surge", "surprise", "surround", "survey", "suspect", "sustain", "swallow", "swamp",
    "swanky", "swap", "swarm", "swear", "sweaty", "sweet", "swift", "swim", "swing", "switch",
    "sword", "swordfish", "sycamore", "symbol", "symptom", "syrup", "system", "table", "tackle",
    "tadpole", "tag", "tail", "talent", "talk", "tamarind", "tangerine", "tangy", "tank", "tape",
    "tapestry", "target", "tarragon", "tart", "task", "taste", "tasty", "tattoo", "tawny", "taxi",
    "teach", "teacup", "team", "teapot", "tell", "ten", "tenant", "tender", "tennis", "tent",
    "tepid", "term", "test", "text", "thank", "that", "theme", "then", "theory", "there", "they",
    "thimble", "thing", "thirsty", "this", "thistle", "thorny", "thought", "three", "thrifty",
    "thrive", "throw", "thrush", "thumb", "thunder", "thyme", "ticket", "tidal", "tide", "tidy",
    "tiger", "tilt", "timber", "timberland", "time", "timely", "tiny", "tip", "tired", "tissue",
    "title", "toadstool", "toast", "toasty", "tobacco", "today", "toddler", "toe", "together",
    "toilet", "token", "tomato", "tomorrow", "tone", "tongue", "tonight", "tool", "tooth", "top",
    "topaz", "topic", "topple", "torch", "tornado", "tortoise", "toss", "total", "toucan",
    "tourist", "toward", "tower", "town", "toy", "track", "trade", "traffic", "tragic", "train",
    "tranquil", "transfer", "trap", "trash", "travel", "tray", "treat", "tree", "trend", "trial",
    "tribe", "trick", "trigger", "trim", "trip", "trophy", "tropical", "trouble", "truck", "true",
    "truly", "trumpet", "trust", "trusty", "truth", "try", "tubby", "tube", "tuition", "tulip",
    "tumble", "tumbleweed", "tuna", "tunnel", "turkey", "turn", "turnip", "turquoise", "turtle",
    "twelve", "twenty", "twice", "twig", "twin", "twinkly", "twist", "two", "type", "typical",
    "ugly", "umbrella", "unable", "unaware", "uncle", "uncover", "under", "undo", "unfair",
    "unfold", "unhappy", "uniform", "unique", "unit", "universe", "unknown", "unlock", "until",
    "unusual", "unveil", "upbeat", "update", "upgrade", "uphold", "upon", "upper", "upset",
    "urban", "urge", "usage", "use", "used", "useful", "useless", "usual", "utility", "vacant",
    "vacuum", "vague", "valiant", "valid", "valley", "valve", "van", "vanilla", "vanish", "vapor",
    "various", "vast", "vault", "vehicle", "velvet", "velvety", "vendor", "venture", "venue",
    "verb", "verbena", "verdant", "verify", "version", "very", "vessel", "veteran", "viable",
    "vibrant", "vicious", "victory", "video", "view", "vigilant", "village", "vineyard", "vintage",
    "violet", "violin", "virtual", "virus", "visa", "visible", "visit", "visual", "vital", "vivid",
    "vocal", "voice", "void", "volcano", "volume", "vote", "voyage", "vulture", "wacky", "wage",
    "wagon", "wait", "walk", "wall", "walnut", "walrus", "want", "warbler", "warfare", "warm",
    "warped", "warrior", "wary", "wash", "wasp", "waste", "water", "waterfall", "watermelon",
    "wave", "wavy", "way", "wealth", "wealthy", "weapon", "wear", "weary", "weasel", "weather",
    "weaver", "web", "wedding", "weekend", "weird", "welcome", "west", "wet", "whale", "what",
    "wheat", "wheatfield", "wheel", "when", "where", "whimsical", "whip", "whirlwind", "whisper",
    "wholesome", "wide", "width", "wife", "wigeon", "wild", "will", "willow", "wily", "win",
    "windmill", "window", "windy", "wine", "wing", "wink", "winner", "winter", "wintry", "wire",
    "wiry", "wisdom", "wise", "wish", "wisteria", "witness", "witty", "wobbly", "woeful", "wolf",
    "wolfhound", "woman", "wonder", "wood", "wooden", "woodpecker", "wool", "woolly", "word",
    "work", "world", "worry", "worth", "wrap", "wreck", "wren", "wrestle", "wrist", "write",
    "wrong", "yak", "yard", "yarrow", "year", "yellow", "you", "young", "youth", "yucca", "zany",
    "zealous", "zebra", "zero", "zesty", "zinnia", "zone", "zoo",
}};

} // namespace

std::span<const std::string_view> WordList() { return kWords; }

} // namespace xfer
